#pragma once

#include "network/discovery.hpp"
#include <QObject>
#include <QHostAddress>
#include <chrono>
#include <memory>
#include <unordered_map>

class QUdpSocket;
class QTimer;

namespace manuscripts::network {

/**
 * UDP multicast/broadcast discovery backend.
 *
 * Needs no mDNS daemon. Periodically announces the advertised ServiceRecord,
 * sends a "bye" on withdraw and expires receivers that fall silent.
 */
class UdpDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    static constexpr quint16 DISCOVERY_PORT = 47778;

    struct Options {
        quint16 port = DISCOVERY_PORT;  // 0 binds an ephemeral port
        std::chrono::milliseconds advertise_interval{1500};
        std::chrono::milliseconds record_ttl{6000};
    };

    explicit UdpDiscoveryBackend(QObject* parent = nullptr);
    explicit UdpDiscoveryBackend(Options options, QObject* parent = nullptr);
    ~UdpDiscoveryBackend() override;

    Result<void, Error> start_advertising(const ServiceRecord& record) override;
    void stop_advertising() override;

    Result<void, Error> start_browsing() override;
    void stop_browsing() override;

    [[nodiscard]] quint16 boundPort() const;

    /**
     * Handle one datagram as if it arrived at `now`. Ignored unless browsing.
     */
    void ingest(const QByteArray& data, const QHostAddress& sender, Timestamp now = Timestamp::now());

    /**
     * Report records not heard from for longer than the TTL as lost.
     */
    void expire(Timestamp now = Timestamp::now());

private slots:
    void onReadyRead();
    void onAdvertiseTick();

private:
    struct RecordEntry {
        ServiceRecord record;
        Timestamp last_seen;
    };

    Result<void, Error> ensureSockets();
    void closeSockets();
    void send(const QByteArray& bytes);
    void armCrashGoodbye();

    Options options_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> advertise_timer_;
    std::unique_ptr<QTimer> prune_timer_;

    bool advertising_ = false;
    bool browsing_ = false;
    ServiceRecord advertised_{};

    std::unordered_map<Uuid, RecordEntry> records_;
};

/**
 * Send the "bye" prepared by the advertising UDP backend, if one is
 * advertising. Async-signal-safe; meant for fatal signal handlers.
 * @return Number of datagrams sent
 */
int send_crash_goodbye() noexcept;

// True while a bye is prepared for send_crash_goodbye().
[[nodiscard]] bool crash_goodbye_armed() noexcept;

// The prepared bye datagram; empty when none is armed.
[[nodiscard]] QByteArray crash_goodbye_payload();

} // namespace manuscripts::network
