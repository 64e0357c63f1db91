#include "network/udp_discovery_backend.hpp"
#include "network/discovery_datagram.hpp"

#include <QByteArray>
#include <QNetworkDatagram>
#include <QUdpSocket>
#include <QTimer>

#include <arpa/inet.h>
#include <atomic>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>

namespace manuscripts::network {
namespace {

const QHostAddress kMulticastGroup(QStringLiteral("239.255.77.78"));
constexpr int kPruneIntervalMs = 1000;

// Everything a fatal signal handler needs to say goodbye, prepared up front.
struct CrashGoodbye {
    std::atomic<bool> armed{false};
    int fd = -1;
    char payload[1024] = {};
    size_t length = 0;
    sockaddr_in targets[2] = {};
};

CrashGoodbye g_crash_goodbye;

void disarmCrashGoodbye(int fd) {
    if (g_crash_goodbye.fd == fd) {
        g_crash_goodbye.armed.store(false);
    }
}

} // namespace

int send_crash_goodbye() noexcept {
    auto& cg = g_crash_goodbye;
    if (!cg.armed.load()) return 0;

    int sent = 0;
    for (const auto& target : cg.targets) {
        if (::sendto(cg.fd, cg.payload, cg.length, 0,
                     reinterpret_cast<const sockaddr*>(&target), sizeof(target)) >= 0) {
            ++sent;
        }
    }
    return sent;
}

bool crash_goodbye_armed() noexcept {
    return g_crash_goodbye.armed.load();
}

QByteArray crash_goodbye_payload() {
    if (!g_crash_goodbye.armed.load()) return {};
    return QByteArray(g_crash_goodbye.payload, static_cast<qsizetype>(g_crash_goodbye.length));
}

UdpDiscoveryBackend::UdpDiscoveryBackend(QObject* parent)
    : UdpDiscoveryBackend(Options{}, parent)
{
}

UdpDiscoveryBackend::UdpDiscoveryBackend(Options options, QObject* parent)
    : QObject(parent)
    , options_(options)
    , advertise_timer_(std::make_unique<QTimer>(this))
    , prune_timer_(std::make_unique<QTimer>(this))
{
    advertise_timer_->setInterval(options_.advertise_interval);
    prune_timer_->setInterval(kPruneIntervalMs);

    connect(advertise_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onAdvertiseTick);
    connect(prune_timer_.get(), &QTimer::timeout, this, [this] { expire(); });
}

UdpDiscoveryBackend::~UdpDiscoveryBackend() {
    on_record_lost = nullptr;
    stop_advertising();
    stop_browsing();
}

Result<void, Error> UdpDiscoveryBackend::ensureSockets() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    if (!socket_->bind(QHostAddress::AnyIPv4,
                       options_.port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                                         "UDP discovery bind failed: " + msg);
    }

    if (!socket_->joinMulticastGroup(kMulticastGroup)) {
        // Broadcast still works without the group.
        qCWarning(discoveryLog) << "Could not join" << kMulticastGroup.toString()
                                << socket_->errorString();
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpDiscoveryBackend::onReadyRead);

    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::closeSockets() {
    if (!socket_) return;
    socket_->leaveMulticastGroup(kMulticastGroup);
    socket_.reset();
}

void UdpDiscoveryBackend::send(const QByteArray& bytes) {
    if (!socket_) return;

    const auto port = boundPort();

    // Multicast (preferred)
    socket_->writeDatagram(bytes, kMulticastGroup, port);

    // Broadcast (helps on networks without multicast)
    socket_->writeDatagram(bytes, QHostAddress::Broadcast, port);
}

Result<void, Error> UdpDiscoveryBackend::start_advertising(const ServiceRecord& record) {
    auto sockets = ensureSockets();
    if (sockets.is_err()) return sockets;

    advertised_ = record;
    advertising_ = true;
    advertise_timer_->start();
    send(encode_discovery_datagram(advertised_));
    armCrashGoodbye();
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::armCrashGoodbye() {
    const auto bye = encode_discovery_datagram(advertised_, true);
    auto& cg = g_crash_goodbye;
    if (!socket_ || static_cast<size_t>(bye.size()) > sizeof(cg.payload)) {
        qCWarning(discoveryLog) << "No crash-time withdrawal for" << advertised_.display_name;
        return;
    }

    cg.armed.store(false);
    cg.fd = static_cast<int>(socket_->socketDescriptor());
    std::memcpy(cg.payload, bye.constData(), static_cast<size_t>(bye.size()));
    cg.length = static_cast<size_t>(bye.size());

    const quint32 addresses[2] = {kMulticastGroup.toIPv4Address(), INADDR_BROADCAST};
    for (int i = 0; i < 2; ++i) {
        cg.targets[i] = sockaddr_in{};
        cg.targets[i].sin_family = AF_INET;
        cg.targets[i].sin_port = htons(boundPort());
        cg.targets[i].sin_addr.s_addr = htonl(addresses[i]);
    }
    cg.armed.store(true);
}

void UdpDiscoveryBackend::stop_advertising() {
    if (advertising_) {
        if (socket_) disarmCrashGoodbye(static_cast<int>(socket_->socketDescriptor()));
        send(encode_discovery_datagram(advertised_, true));
    }
    advertising_ = false;
    advertise_timer_->stop();
    if (!browsing_) {
        closeSockets();
    }
}

Result<void, Error> UdpDiscoveryBackend::start_browsing() {
    auto sockets = ensureSockets();
    if (sockets.is_err()) return sockets;

    browsing_ = true;
    prune_timer_->start();
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::stop_browsing() {
    browsing_ = false;
    prune_timer_->stop();

    if (on_record_lost) {
        for (const auto& [id, entry] : records_) {
            on_record_lost(id);
        }
    }
    records_.clear();

    if (!advertising_) {
        closeSockets();
    }
}

quint16 UdpDiscoveryBackend::boundPort() const {
    return socket_ ? socket_->localPort() : options_.port;
}

void UdpDiscoveryBackend::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        const auto datagram = socket_->receiveDatagram();
        ingest(datagram.data(), datagram.senderAddress());
    }
}

void UdpDiscoveryBackend::ingest(const QByteArray& data, const QHostAddress& sender, Timestamp now) {
    if (!browsing_) return;

    auto decoded = decode_discovery_datagram(data, sender);
    if (decoded.is_err()) {
        qCDebug(discoveryLog) << "Ignoring datagram from" << sender.toString()
                              << decoded.unwrap_err().message.c_str();
        return;
    }

    auto [record, bye] = std::move(decoded).unwrap();
    auto it = records_.find(record.instance_id);

    if (bye) {
        if (it != records_.end()) {
            records_.erase(it);
            if (on_record_lost) on_record_lost(record.instance_id);
        }
        return;
    }

    if (it == records_.end()) {
        records_.emplace(record.instance_id, RecordEntry{record, now});
    } else {
        it->second = RecordEntry{record, now};
    }
    // Refreshes are reported too; the browser drops unchanged ones.
    if (on_record_seen) on_record_seen(record);
}

void UdpDiscoveryBackend::onAdvertiseTick() {
    if (advertising_) {
        send(encode_discovery_datagram(advertised_));
    }
}

void UdpDiscoveryBackend::expire(Timestamp now) {
    if (!browsing_) return;

    std::vector<Uuid> to_remove;
    for (const auto& [id, entry] : records_) {
        if ((now - entry.last_seen) > options_.record_ttl) {
            to_remove.push_back(id);
        }
    }

    for (const auto& id : to_remove) {
        records_.erase(id);
        if (on_record_lost) on_record_lost(id);
    }
}

} // namespace manuscripts::network
