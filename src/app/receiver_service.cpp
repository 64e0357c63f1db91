#include "app/receiver_service.hpp"

#include <QDebug>

namespace manuscripts::app {

ReceiverService::ReceiverService(ReceiverConfig config, QObject* parent)
    : ReceiverService(config, network::createDiscoveryBackend(config.discovery), parent)
{
}

ReceiverService::ReceiverService(ReceiverConfig config,
                                 std::unique_ptr<network::DiscoveryBackend> backend,
                                 QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , store_(config_.destination)
{
    network::ServerOptions options;
    options.idle_timeout = config_.idle_timeout;
    options.max_submission_bytes = config_.max_submission_bytes;

    server_ = std::make_unique<network::SubmissionServer>(
        credentials_, store_, bus_, options);
    advertiser_ = std::make_unique<network::ServiceAdvertiser>(std::move(backend));

    connect(server_.get(), &network::SubmissionServer::drained,
            this, &ReceiverService::onDrained);
    connect(advertiser_.get(), &network::ServiceAdvertiser::failed,
            this, &ReceiverService::advertisementFailed);
}

ReceiverService::~ReceiverService() {
    withdraw();
    if (config_.passphrase) {
        crypto::secure_zero(config_.passphrase->data(), config_.passphrase->size());
    }
}

Result<uint16_t, Error> ReceiverService::start() {
    using R = Result<uint16_t, Error>;
    if (state_ != State::Idle) {
        return R::fail(ErrorCode::AlreadyConfigured, "Receiver already started");
    }

    auto configured = credentials_.configure(config_.display_name,
                                             std::move(config_.passphrase),
                                             config_.kdf);
    if (configured.is_err()) {
        return R::err(configured.unwrap_err());
    }

    auto listening = server_->listen(config_.port, config_.listen_address);
    if (listening.is_err() && config_.allow_port_fallback && config_.port != 0) {
        qWarning() << "Port" << config_.port << "unavailable, using an ephemeral port";
        listening = server_->listen(0, config_.listen_address);
    }
    if (listening.is_err()) {
        return listening;
    }
    const uint16_t port = listening.unwrap();

    record_ = network::ServiceRecord{};
    record_.display_name = config_.display_name;
    record_.port = port;
    record_.protocol_version = PROTOCOL_VERSION;
    record_.requires_passphrase = credentials_.requiresPassphrase();
    record_.instance_id = config_.instance_id.is_nil() ? Uuid::generate() : config_.instance_id;
    record_.mode = config_.mode;

    auto published = advertiser_->publish(record_);
    if (published.is_err()) {
        server_->stop(std::chrono::milliseconds{0});
        state_ = State::Stopped;
        return R::err(published.unwrap_err());
    }
    handle_ = published.unwrap();
    state_ = State::Running;

    StatusEvent event;
    event.kind = StatusEventKind::Listening;
    event.port = port;
    bus_.publish(event);

    qInfo() << "Receiver" << config_.display_name << "ready on port" << port
            << "saving to" << store_.destination();
    return R::ok(port);
}

void ReceiverService::stop() {
    if (state_ != State::Running) {
        if (state_ == State::Idle) {
            state_ = State::Stopped;
            emit stopped();
        }
        return;
    }
    state_ = State::Stopping;

    StatusEvent event;
    event.kind = StatusEventKind::ShuttingDown;
    bus_.publish(event);

    withdraw();
    server_->stop(config_.grace);
}

void ReceiverService::withdraw() {
    if (advertiser_ && handle_.valid()) {
        advertiser_->withdraw(handle_);
        handle_ = {};
    }
}

void ReceiverService::onDrained() {
    if (state_ != State::Stopping) return;
    state_ = State::Stopped;
    qInfo() << "Receiver stopped;" << bus_.succeededCount() << "submission(s) received";
    emit stopped();
}

} // namespace manuscripts::app
