#include <catch2/catch_test_macros.hpp>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QSignalSpy>
#include <QUdpSocket>

#include <functional>

#include "network/discovery.hpp"
#include "network/discovery_datagram.hpp"
#include "network/udp_discovery_backend.hpp"

using namespace manuscripts;
using namespace manuscripts::network;
using namespace std::chrono_literals;

namespace {

bool spinUntil(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

ServiceRecord okafor() {
    ServiceRecord record;
    record.instance_id = Uuid::generate();
    record.display_name = QStringLiteral("Ms. Okafor");
    record.port = 8765;
    return record;
}

UdpDiscoveryBackend::Options ephemeral() {
    UdpDiscoveryBackend::Options options;
    options.port = 0;
    return options;
}

const QHostAddress kClassroomHost(QStringLiteral("192.168.1.40"));

} // namespace

TEST_CASE("UDP backend: announcements, refreshes and bye", "[integration][network][discovery]") {
    auto backend = std::make_unique<UdpDiscoveryBackend>(ephemeral());
    auto* udp = backend.get();
    ServiceBrowser browser(std::move(backend));

    QSignalSpy added(&browser, &ServiceBrowser::recordAdded);
    QSignalSpy updated(&browser, &ServiceBrowser::recordUpdated);
    QSignalSpy removed(&browser, &ServiceBrowser::recordRemoved);

    if (browser.start().is_err()) {
        SKIP("UDP bind not permitted in this environment");
    }

    const auto record = okafor();
    const Timestamp t0(10'000'000);

    udp->ingest(encode_discovery_datagram(record), kClassroomHost, t0);
    REQUIRE(added.count() == 1);
    REQUIRE(browser.record(record.instance_id)->host == kClassroomHost);

    SECTION("refreshes do not add the record again") {
        udp->ingest(encode_discovery_datagram(record), kClassroomHost, Timestamp(t0.millis() + 1500));
        udp->ingest(encode_discovery_datagram(record), kClassroomHost, Timestamp(t0.millis() + 3000));
        REQUIRE(added.count() == 1);
        REQUIRE(updated.count() == 0);
        REQUIRE(browser.recordCount() == 1);
    }

    SECTION("bye removes the record at once") {
        udp->ingest(encode_discovery_datagram(record, true), kClassroomHost, Timestamp(t0.millis() + 100));
        REQUIRE(removed.count() == 1);
        REQUIRE(browser.recordCount() == 0);

        // A second bye for the same instance changes nothing.
        udp->ingest(encode_discovery_datagram(record, true), kClassroomHost, Timestamp(t0.millis() + 200));
        REQUIRE(removed.count() == 1);
    }

    SECTION("garbage is ignored") {
        udp->ingest(QByteArray("not json"), kClassroomHost, t0);
        REQUIRE(browser.recordCount() == 1);
        REQUIRE(removed.count() == 0);
    }
}

TEST_CASE("UDP backend: silent receivers expire after the TTL", "[integration][network][discovery]") {
    auto backend = std::make_unique<UdpDiscoveryBackend>(ephemeral());
    auto* udp = backend.get();
    ServiceBrowser browser(std::move(backend));
    QSignalSpy removed(&browser, &ServiceBrowser::recordRemoved);

    if (browser.start().is_err()) {
        SKIP("UDP bind not permitted in this environment");
    }

    const auto record = okafor();
    const Timestamp t0(20'000'000);
    udp->ingest(encode_discovery_datagram(record), kClassroomHost, t0);

    udp->expire(Timestamp(t0.millis() + 5000));
    REQUIRE(removed.count() == 0);

    SECTION("without a refresh") {
        udp->expire(Timestamp(t0.millis() + 6001));
        REQUIRE(removed.count() == 1);
        REQUIRE(browser.recordCount() == 0);
    }

    SECTION("a refresh restarts the clock") {
        udp->ingest(encode_discovery_datagram(record), kClassroomHost, Timestamp(t0.millis() + 4000));
        udp->expire(Timestamp(t0.millis() + 9000));
        REQUIRE(removed.count() == 0);
        udp->expire(Timestamp(t0.millis() + 10'001));
        REQUIRE(removed.count() == 1);
    }
}

TEST_CASE("UDP backend: receives datagrams on its socket", "[integration][network][discovery]") {
    auto backend = std::make_unique<UdpDiscoveryBackend>(ephemeral());
    auto* udp = backend.get();
    ServiceBrowser browser(std::move(backend));
    QSignalSpy added(&browser, &ServiceBrowser::recordAdded);

    if (browser.start().is_err() || udp->boundPort() == 0) {
        SKIP("UDP bind not permitted in this environment");
    }

    QUdpSocket announcer;
    const auto record = okafor();
    const auto sent = announcer.writeDatagram(encode_discovery_datagram(record),
                                              QHostAddress::LocalHost, udp->boundPort());
    if (sent < 0) {
        SKIP("UDP send not permitted in this environment");
    }

    REQUIRE(spinUntil([&] { return added.count() == 1; }, 3000));
    REQUIRE(browser.record(record.instance_id)->port == 8765);
    REQUIRE(browser.record(record.instance_id)->host.isLoopback());
}

TEST_CASE("UDP backend: a goodbye is ready for fatal signals", "[integration][network][discovery]") {
    UdpDiscoveryBackend backend(ephemeral());
    const auto record = okafor();

    if (backend.start_advertising(record).is_err()) {
        SKIP("UDP bind not permitted in this environment");
    }
    REQUIRE(crash_goodbye_armed());

    auto decoded = decode_discovery_datagram(crash_goodbye_payload(), kClassroomHost);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().bye);
    REQUIRE(decoded.unwrap().record.instance_id == record.instance_id);

    backend.stop_advertising();
    REQUIRE_FALSE(crash_goodbye_armed());
    REQUIRE(send_crash_goodbye() == 0);
}
