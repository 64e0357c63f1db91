#include "app/signal_watcher.hpp"
#include "network/udp_discovery_backend.hpp"

#include <QSocketNotifier>
#include <QtGlobal>

#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

namespace manuscripts::app {
namespace {

int g_signal_fds[2] = {-1, -1};

constexpr int kFatalSignals[] = {SIGSEGV, SIGBUS, SIGILL, SIGFPE, SIGABRT};

void handle_signal(int signal_number) {
    const char byte = static_cast<char>(signal_number);
    // Nothing useful to do on failure inside a signal handler.
    [[maybe_unused]] const auto written = ::write(g_signal_fds[0], &byte, 1);
}

void handle_fatal_signal(int signal_number) {
    network::send_crash_goodbye();
    // SA_RESETHAND restored the default action.
    ::raise(signal_number);
}

} // namespace

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signal_fds) != 0) {
        qWarning("SignalWatcher: socketpair failed; signals use default handling");
        g_signal_fds[0] = g_signal_fds[1] = -1;
        return;
    }

    notifier_ = std::make_unique<QSocketNotifier>(g_signal_fds[1], QSocketNotifier::Read, this);
    connect(notifier_.get(), &QSocketNotifier::activated, this, &SignalWatcher::onActivated);

    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    struct sigaction fatal {};
    fatal.sa_handler = handle_fatal_signal;
    sigemptyset(&fatal.sa_mask);
    fatal.sa_flags = SA_RESETHAND | SA_NODEFER;
    for (const int sig : kFatalSignals) {
        ::sigaction(sig, &fatal, nullptr);
    }
}

SignalWatcher::~SignalWatcher() {
    if (!notifier_) return;

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    for (const int sig : kFatalSignals) {
        std::signal(sig, SIG_DFL);
    }
    notifier_.reset();
    ::close(g_signal_fds[0]);
    ::close(g_signal_fds[1]);
    g_signal_fds[0] = g_signal_fds[1] = -1;
}

void SignalWatcher::onActivated() {
    notifier_->setEnabled(false);
    char byte = 0;
    if (::read(g_signal_fds[1], &byte, 1) == 1) {
        emit terminationRequested(static_cast<int>(byte));
    }
    notifier_->setEnabled(true);
}

} // namespace manuscripts::app
