#include "network/discovery.hpp"
#include "network/udp_discovery_backend.hpp"

#include <QDebug>
#include <QProcessEnvironment>
#include <algorithm>

Q_LOGGING_CATEGORY(discoveryLog, "manuscripts.discovery")

namespace manuscripts::network {

// Implemented in platform/linux/avahi_discovery.cpp
std::unique_ptr<DiscoveryBackend> createAvahiBackend();

const char* service_mode_name(ServiceMode mode) noexcept {
    switch (mode) {
        case ServiceMode::Receiver: return "receiver";
        case ServiceMode::Share: return "share";
    }
    return "receiver";
}

std::optional<ServiceMode> parse_service_mode(const QString& text) {
    const auto normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("receiver")) return ServiceMode::Receiver;
    if (normalized == QLatin1String("share")) return ServiceMode::Share;
    return std::nullopt;
}

std::optional<DiscoveryKind> parse_discovery_kind(const QString& text) {
    const auto normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("mdns") || normalized == QLatin1String("avahi")) {
        return DiscoveryKind::Mdns;
    }
    if (normalized == QLatin1String("udp")) return DiscoveryKind::Udp;
    return std::nullopt;
}

DiscoveryKind default_discovery_kind() {
    const auto env = qEnvironmentVariable("MANUSCRIPTS_DISCOVERY_BACKEND");
    if (env.isEmpty()) return DiscoveryKind::Mdns;

    if (auto kind = parse_discovery_kind(env)) {
        return *kind;
    }
    qCWarning(discoveryLog) << "Ignoring unknown MANUSCRIPTS_DISCOVERY_BACKEND" << env;
    return DiscoveryKind::Mdns;
}

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(DiscoveryKind kind) {
    switch (kind) {
        case DiscoveryKind::Udp:
            return std::make_unique<UdpDiscoveryBackend>();
        case DiscoveryKind::Mdns:
            return createAvahiBackend();
    }
    return createAvahiBackend();
}

// ServiceAdvertiser

ServiceAdvertiser::ServiceAdvertiser(std::unique_ptr<DiscoveryBackend> backend, QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
{
    if (backend_) {
        backend_->on_error = [this](Error err) {
            qCWarning(discoveryLog) << "Advertisement failed:" << err.message.c_str();
            emit failed(QString::fromStdString(err.message));
        };
    }
}

ServiceAdvertiser::~ServiceAdvertiser() {
    withdraw(current_);
    if (backend_) {
        backend_->on_error = nullptr;
    }
}

Result<ServiceAdvertiser::Handle, Error> ServiceAdvertiser::publish(const ServiceRecord& record) {
    using R = Result<Handle, Error>;
    if (!backend_) {
        return R::fail(ErrorCode::DiscoveryUnavailable, "Discovery backend not available");
    }

    if (current_.valid()) {
        backend_->stop_advertising();
        current_ = Handle{};
    }

    auto started = backend_->start_advertising(record);
    if (started.is_err()) {
        return R::err(started.unwrap_err());
    }

    record_ = record;
    current_ = Handle{next_id_++};
    qCInfo(discoveryLog) << "Advertising" << record.display_name << "on port" << record.port
                         << (record.requires_passphrase ? "(passphrase required)" : "");
    return R::ok(current_);
}

void ServiceAdvertiser::withdraw(Handle handle) {
    if (!handle.valid() || handle != current_ || !backend_) {
        return;
    }
    backend_->stop_advertising();
    current_ = Handle{};
    qCInfo(discoveryLog) << "Withdrew advertisement for" << record_.display_name;
}

// ServiceBrowser

ServiceBrowser::ServiceBrowser(std::unique_ptr<DiscoveryBackend> backend, QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
{
    qRegisterMetaType<manuscripts::network::ServiceRecord>();

    if (backend_) {
        backend_->on_record_seen = [this](ServiceRecord record) {
            handleRecordSeen(std::move(record));
        };
        backend_->on_record_lost = [this](Uuid instance_id) {
            handleRecordLost(instance_id);
        };
        backend_->on_error = [this](Error err) {
            emit error(QString::fromStdString(err.message));
        };
    }
}

ServiceBrowser::~ServiceBrowser() {
    if (backend_ && browsing_) {
        browsing_ = false;
        records_.clear();
        backend_->stop_browsing();
    }
}

Result<void, Error> ServiceBrowser::start() {
    if (!backend_) {
        return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                                         "Discovery backend not available");
    }
    if (browsing_) {
        return Result<void, Error>::ok();
    }

    auto result = backend_->start_browsing();
    if (result.is_err()) {
        emit error(QString::fromStdString(result.unwrap_err().message));
        return result;
    }

    browsing_ = true;
    emit browsingChanged();
    return Result<void, Error>::ok();
}

void ServiceBrowser::stop() {
    if (!backend_ || !browsing_) {
        return;
    }

    browsing_ = false;
    auto known = std::move(records_);
    records_.clear();
    backend_->stop_browsing();

    for (const auto& [id, record] : known) {
        emit recordRemoved(record);
    }
    emit browsingChanged();
    if (!known.empty()) {
        emit recordsChanged();
    }
}

std::vector<ServiceRecord> ServiceBrowser::records() const {
    std::vector<ServiceRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record);
    }
    std::sort(out.begin(), out.end(), [](const ServiceRecord& a, const ServiceRecord& b) {
        return a.display_name.localeAwareCompare(b.display_name) < 0;
    });
    return out;
}

std::optional<ServiceRecord> ServiceBrowser::record(const Uuid& instance_id) const {
    auto it = records_.find(instance_id);
    if (it != records_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<ServiceRecord> ServiceBrowser::findByName(const QString& display_name) const {
    for (const auto& record : records()) {
        if (record.display_name.compare(display_name, Qt::CaseInsensitive) == 0) {
            return record;
        }
    }
    return std::nullopt;
}

void ServiceBrowser::handleRecordSeen(ServiceRecord record) {
    if (!browsing_) return;

    if (record.protocol_version != PROTOCOL_VERSION) {
        qCDebug(discoveryLog) << "Skipping" << record.display_name
                              << "with protocol version" << record.protocol_version;
        // A known instance that moved to another version is no longer usable.
        handleRecordLost(record.instance_id);
        return;
    }
    if (record.instance_id.is_nil() || record.port == 0) {
        qCDebug(discoveryLog) << "Skipping incomplete record" << record.display_name;
        return;
    }

    auto it = records_.find(record.instance_id);
    if (it == records_.end()) {
        records_.emplace(record.instance_id, record);
        emit recordAdded(record);
        emit recordsChanged();
    } else if (!(it->second == record)) {
        it->second = record;
        emit recordUpdated(record);
    }
}

void ServiceBrowser::handleRecordLost(const Uuid& instance_id) {
    auto it = records_.find(instance_id);
    if (it == records_.end()) {
        return;
    }

    auto record = std::move(it->second);
    records_.erase(it);
    emit recordRemoved(record);
    emit recordsChanged();
}

} // namespace manuscripts::network
