#pragma once

#include <QObject>
#include <memory>

class QSocketNotifier;

namespace manuscripts::app {

/**
 * SignalWatcher - Turns SIGINT/SIGTERM into a Qt signal.
 *
 * The handler only writes the signal number to a socketpair; the notifier
 * delivers it on the event loop. Fatal signals (SIGSEGV, SIGBUS, SIGILL,
 * SIGFPE, SIGABRT) send the prepared UDP goodbye and then take their default
 * action. One instance per process.
 */
class SignalWatcher : public QObject {
    Q_OBJECT

public:
    explicit SignalWatcher(QObject* parent = nullptr);
    ~SignalWatcher() override;

    [[nodiscard]] bool isActive() const { return notifier_ != nullptr; }

signals:
    void terminationRequested(int signal_number);

private slots:
    void onActivated();

private:
    std::unique_ptr<QSocketNotifier> notifier_;
};

} // namespace manuscripts::app
