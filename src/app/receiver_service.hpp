#pragma once

#include "app/settings.hpp"
#include "core/identity.hpp"
#include "core/result.hpp"
#include "core/status_bus.hpp"
#include "network/discovery.hpp"
#include "network/submission_server.hpp"
#include "storage/submission_store.hpp"

#include <QHostAddress>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace manuscripts::app {

struct ReceiverConfig {
    QString display_name;
    std::optional<std::string> passphrase;
    uint16_t port = DEFAULT_PORT;
    bool allow_port_fallback = true;  // take any free port when `port` is busy
    QHostAddress listen_address = QHostAddress::Any;
    QString destination;
    network::ServiceMode mode = network::ServiceMode::Receiver;
    Uuid instance_id;
    network::DiscoveryKind discovery = network::DiscoveryKind::Mdns;
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds grace{5000};
    crypto::KdfParams kdf = crypto::KdfParams::interactive();
    std::optional<uint64_t> max_submission_bytes;
};

/**
 * ReceiverService - A running receiver: credentials, storage, server and
 * advertisement wired together.
 *
 * start() brings the pieces up in dependency order and fails as a whole.
 * stop() withdraws the advertisement first, then drains the server; the
 * advertisement is also withdrawn when the service is destroyed.
 */
class ReceiverService : public QObject {
    Q_OBJECT

public:
    enum class State { Idle, Running, Stopping, Stopped };

    explicit ReceiverService(ReceiverConfig config, QObject* parent = nullptr);
    ReceiverService(ReceiverConfig config,
                    std::unique_ptr<network::DiscoveryBackend> backend,
                    QObject* parent = nullptr);
    ~ReceiverService() override;

    /**
     * @return The port submissions are accepted on
     */
    Result<uint16_t, Error> start();

    void stop();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] uint16_t port() const { return server_->port(); }
    [[nodiscard]] const network::ServiceRecord& record() const { return record_; }
    [[nodiscard]] bool isAdvertised() const { return advertiser_->isPublished(); }

    [[nodiscard]] StatusEventBus& bus() { return bus_; }
    [[nodiscard]] const CredentialStore& credentials() const { return credentials_; }
    [[nodiscard]] storage::SubmissionStore& store() { return store_; }
    [[nodiscard]] network::SubmissionServer& server() { return *server_; }

signals:
    void stopped();
    void advertisementFailed(const QString& message);

private:
    void withdraw();
    void onDrained();

    ReceiverConfig config_;
    StatusEventBus bus_;
    CredentialStore credentials_;
    storage::SubmissionStore store_;
    std::unique_ptr<network::SubmissionServer> server_;
    std::unique_ptr<network::ServiceAdvertiser> advertiser_;
    network::ServiceAdvertiser::Handle handle_;
    network::ServiceRecord record_;
    State state_ = State::Idle;
};

} // namespace manuscripts::app
