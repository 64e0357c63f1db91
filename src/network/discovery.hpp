#pragma once

#include "core/result.hpp"
#include "core/submission.hpp"
#include "core/types.hpp"

#include <QHostAddress>
#include <QLoggingCategory>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(discoveryLog)

namespace manuscripts::network {

/**
 * DNS-SD service type of a receiver.
 *
 * TXT records:
 * - v=<protocol_version>
 * - auth=0|1
 * - id=<instance uuid>
 * - teacher=<display name>
 * - mode=receiver|share
 */
inline constexpr const char* SERVICE_TYPE = "_manuscripts._tcp";

enum class ServiceMode { Receiver, Share };

[[nodiscard]] const char* service_mode_name(ServiceMode mode) noexcept;
[[nodiscard]] std::optional<ServiceMode> parse_service_mode(const QString& text);

/**
 * ServiceRecord - One advertised receiver.
 *
 * `host` is filled in by the browser from the resolved address; the
 * advertiser ignores it and publishes on every interface.
 */
struct ServiceRecord {
    QString display_name;
    QHostAddress host;
    uint16_t port = 0;
    int protocol_version = PROTOCOL_VERSION;
    bool requires_passphrase = false;
    Uuid instance_id;
    ServiceMode mode = ServiceMode::Receiver;

    bool operator==(const ServiceRecord& other) const {
        return instance_id == other.instance_id &&
               display_name == other.display_name &&
               host == other.host &&
               port == other.port &&
               protocol_version == other.protocol_version &&
               requires_passphrase == other.requires_passphrase &&
               mode == other.mode;
    }
};

/**
 * DiscoveryBackend - Abstract interface for the announcement transport.
 *
 * Callbacks are invoked on the thread that owns the backend.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual Result<void, Error> start_advertising(const ServiceRecord& record) = 0;
    virtual void stop_advertising() = 0;

    virtual Result<void, Error> start_browsing() = 0;
    virtual void stop_browsing() = 0;

    // Callbacks
    std::function<void(ServiceRecord)> on_record_seen;  // new or refreshed
    std::function<void(Uuid)> on_record_lost;
    std::function<void(Error)> on_error;                // asynchronous failures
};

enum class DiscoveryKind { Mdns, Udp };

[[nodiscard]] std::optional<DiscoveryKind> parse_discovery_kind(const QString& text);

/**
 * Kind named by MANUSCRIPTS_DISCOVERY_BACKEND, or Mdns when unset.
 */
[[nodiscard]] DiscoveryKind default_discovery_kind();

[[nodiscard]] std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(DiscoveryKind kind);

/**
 * ServiceAdvertiser - Publishes this receiver's ServiceRecord.
 *
 * One record at a time; publishing again replaces the previous record and
 * invalidates its handle. Destruction withdraws.
 */
class ServiceAdvertiser : public QObject {
    Q_OBJECT

public:
    struct Handle {
        uint64_t id = 0;
        [[nodiscard]] bool valid() const { return id != 0; }
        bool operator==(const Handle&) const = default;
    };

    explicit ServiceAdvertiser(std::unique_ptr<DiscoveryBackend> backend, QObject* parent = nullptr);
    ~ServiceAdvertiser() override;

    /**
     * Fails with DiscoveryUnavailable when the backend cannot announce.
     */
    Result<Handle, Error> publish(const ServiceRecord& record);

    /**
     * Remove the announcement. Unknown or stale handles are ignored, so
     * every shutdown path may call this.
     */
    void withdraw(Handle handle);

    [[nodiscard]] bool isPublished() const { return current_.valid(); }
    [[nodiscard]] const ServiceRecord& record() const { return record_; }

signals:
    void failed(const QString& message);

private:
    std::unique_ptr<DiscoveryBackend> backend_;
    ServiceRecord record_;
    Handle current_;
    uint64_t next_id_ = 1;
};

/**
 * ServiceBrowser - Sender-side view of the receivers on the network.
 *
 * start()/stop() may be repeated; each start() reports receivers as they
 * are seen again. Records with a protocol version this build does not speak
 * are skipped. A resolved record is only a hint: connecting is the test.
 */
class ServiceBrowser : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool browsing READ isBrowsing NOTIFY browsingChanged)
    Q_PROPERTY(int recordCount READ recordCount NOTIFY recordsChanged)

public:
    explicit ServiceBrowser(std::unique_ptr<DiscoveryBackend> backend, QObject* parent = nullptr);
    ~ServiceBrowser() override;

    Result<void, Error> start();

    /**
     * Stop browsing; every cached record is reported removed.
     */
    void stop();

    [[nodiscard]] std::vector<ServiceRecord> records() const;
    [[nodiscard]] std::optional<ServiceRecord> record(const Uuid& instance_id) const;

    /**
     * First record whose display name matches case-insensitively.
     */
    [[nodiscard]] std::optional<ServiceRecord> findByName(const QString& display_name) const;

    [[nodiscard]] bool isBrowsing() const { return browsing_; }
    [[nodiscard]] int recordCount() const { return static_cast<int>(records_.size()); }

signals:
    void recordAdded(const manuscripts::network::ServiceRecord& record);
    void recordUpdated(const manuscripts::network::ServiceRecord& record);
    void recordRemoved(const manuscripts::network::ServiceRecord& record);
    void browsingChanged();
    void recordsChanged();
    void error(const QString& message);

private:
    void handleRecordSeen(ServiceRecord record);
    void handleRecordLost(const Uuid& instance_id);

    std::unique_ptr<DiscoveryBackend> backend_;
    std::unordered_map<Uuid, ServiceRecord> records_;
    bool browsing_ = false;
};

} // namespace manuscripts::network

Q_DECLARE_METATYPE(manuscripts::network::ServiceRecord)
