#include <catch2/catch_test_macros.hpp>

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <functional>
#include <optional>

#include "app/receiver_service.hpp"
#include "fake_discovery_backend.hpp"
#include "network/codec.hpp"

using namespace manuscripts;
using namespace manuscripts::app;
using namespace std::chrono_literals;
using manuscripts::testing::FakeDiscoveryBackend;

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

ReceiverConfig loopbackConfig(const QString& destination) {
    ReceiverConfig config;
    config.display_name = QStringLiteral("Ms. Okafor");
    config.port = 0;
    config.listen_address = QHostAddress::LocalHost;
    config.destination = destination;
    config.grace = 300ms;
    config.kdf = crypto::KdfParams::minimum();
    return config;
}

} // namespace

TEST_CASE("ReceiverService advertises what it serves", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    auto config = loopbackConfig(dir.path());
    config.passphrase = std::string("correct horse");
    config.mode = network::ServiceMode::Share;

    ReceiverService service(config, std::make_unique<FakeDiscoveryBackend>(state));
    QSignalSpy events(&service.bus(), &StatusEventBus::eventPublished);

    auto port = service.start();
    if (port.is_err() && port.unwrap_err().code == ErrorCode::ListenFailed) {
        SKIP("TCP listen not permitted in this environment");
    }
    REQUIRE(port.is_ok());
    REQUIRE(service.state() == ReceiverService::State::Running);
    REQUIRE(service.isAdvertised());

    REQUIRE(state->advertised.size() == 1);
    const auto& record = state->advertised.front();
    REQUIRE(record.port == port.unwrap());
    REQUIRE(record.display_name == QStringLiteral("Ms. Okafor"));
    REQUIRE(record.requires_passphrase);
    REQUIRE(record.mode == network::ServiceMode::Share);
    REQUIRE_FALSE(record.instance_id.is_nil());

    REQUIRE(events.count() == 1);
    REQUIRE(events.at(0).at(0).value<StatusEvent>().kind == StatusEventKind::Listening);

    SECTION("starting twice is refused") {
        auto again = service.start();
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().code == ErrorCode::AlreadyConfigured);
    }
}

TEST_CASE("ReceiverService fails as a whole when it cannot advertise", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    state->fail_advertising = true;

    ReceiverService service(loopbackConfig(dir.path()), std::make_unique<FakeDiscoveryBackend>(state));
    auto port = service.start();
    REQUIRE(port.is_err());
    if (port.unwrap_err().code == ErrorCode::ListenFailed) {
        SKIP("TCP listen not permitted in this environment");
    }
    REQUIRE(port.unwrap_err().code == ErrorCode::DiscoveryUnavailable);
    REQUIRE_FALSE(service.server().isListening());
    REQUIRE(service.state() == ReceiverService::State::Stopped);
}

TEST_CASE("ReceiverService withdraws before it stops serving", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    ReceiverService service(loopbackConfig(dir.path()), std::make_unique<FakeDiscoveryBackend>(state));

    auto port = service.start();
    if (port.is_err()) {
        SKIP("TCP listen not permitted in this environment");
    }

    QSignalSpy stopped(&service, &ReceiverService::stopped);
    service.stop();

    REQUIRE_FALSE(state->advertising);
    REQUIRE(state->withdraw_calls == 1);
    REQUIRE(spinUntil([&] { return stopped.count() == 1; }, 2000));
    REQUIRE(service.state() == ReceiverService::State::Stopped);

    // Nothing is accepted any more.
    QTcpSocket late;
    late.connectToHost(QHostAddress::LocalHost, port.unwrap());
    const bool refused = spinUntil([&] {
        return late.state() == QAbstractSocket::UnconnectedState;
    }, 2000);
    REQUIRE(refused);
    REQUIRE(service.server().activeSessionCount() == 0);
}

TEST_CASE("ReceiverService interrupts sessions after the grace period", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    ReceiverService service(loopbackConfig(dir.path()), std::make_unique<FakeDiscoveryBackend>(state));

    auto port = service.start();
    if (port.is_err()) {
        SKIP("TCP listen not permitted in this environment");
    }

    std::optional<StatusEvent> terminal;
    service.bus().subscribe([&](const StatusEvent& event) {
        if (event.kind == StatusEventKind::SessionChanged && is_terminal(event.state)) {
            terminal = event;
        }
    });

    // A sender that stalls halfway through its body.
    network::SubmissionRequest request;
    request.sender_name = QStringLiteral("Room 204");
    request.file_name = QStringLiteral("essay.pdf");
    request.size_bytes = 1000;

    QTcpSocket slow;
    slow.connectToHost(QHostAddress::LocalHost, port.unwrap());
    REQUIRE(spinUntil([&] { return slow.state() == QAbstractSocket::ConnectedState; }, 2000));
    slow.write(network::encodeSubmissionRequest(request));
    REQUIRE(spinUntil([&] { return slow.bytesAvailable() > 0; }, 2000));
    slow.write(QByteArray(100, 'x'));
    REQUIRE(spinUntil([&] { return service.server().activeSessionCount() == 1; }, 2000));

    QSignalSpy stopped(&service, &ReceiverService::stopped);
    QElapsedTimer elapsed;
    elapsed.start();
    service.stop();
    REQUIRE_FALSE(state->advertising);

    REQUIRE(spinUntil([&] { return stopped.count() == 1; }, 3000));
    REQUIRE(elapsed.elapsed() >= 250);

    REQUIRE(terminal.has_value());
    REQUIRE(terminal->state == SessionState::Failed);
    REQUIRE(terminal->failure == ErrorCode::TransportInterrupted);
    REQUIRE(QDir(dir.path()).entryList(QDir::Files | QDir::Hidden).isEmpty());
}

TEST_CASE("ReceiverService lets a session finish within the grace period", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    auto config = loopbackConfig(dir.path());
    config.grace = 3000ms;
    ReceiverService service(config, std::make_unique<FakeDiscoveryBackend>(state));

    auto port = service.start();
    if (port.is_err()) {
        SKIP("TCP listen not permitted in this environment");
    }

    std::optional<StatusEvent> terminal;
    service.bus().subscribe([&](const StatusEvent& event) {
        if (event.kind == StatusEventKind::SessionChanged && is_terminal(event.state)) {
            terminal = event;
        }
    });

    network::SubmissionRequest request;
    request.sender_name = QStringLiteral("Room 204");
    request.file_name = QStringLiteral("essay.pdf");
    request.size_bytes = 1000;

    QTcpSocket sender;
    sender.connectToHost(QHostAddress::LocalHost, port.unwrap());
    REQUIRE(spinUntil([&] { return sender.state() == QAbstractSocket::ConnectedState; }, 2000));
    sender.write(network::encodeSubmissionRequest(request));
    REQUIRE(spinUntil([&] { return sender.bytesAvailable() > 0; }, 2000));
    sender.readAll();
    sender.write(QByteArray(600, 'x'));
    REQUIRE(spinUntil([&] { return service.server().activeSessionCount() == 1; }, 2000));

    QSignalSpy stopped(&service, &ReceiverService::stopped);
    service.stop();
    REQUIRE_FALSE(state->advertising);
    REQUIRE(stopped.count() == 0);

    // The rest of the body arrives after stop() but well within the grace period.
    sender.write(QByteArray(400, 'x') + network::encodeBodyComplete(1000));

    QByteArray reply;
    REQUIRE(spinUntil([&] {
        reply.append(sender.readAll());
        return stopped.count() == 1;
    }, 2500));

    REQUIRE(terminal.has_value());
    REQUIRE(terminal->state == SessionState::Succeeded);
    REQUIRE(terminal->stored.has_value());
    REQUIRE(QFileInfo(terminal->stored->final_path).size() == 1000);
    REQUIRE(QDir(dir.path()).entryList(QDir::Files) == QStringList{QStringLiteral("204-essay.pdf")});

    reply.append(sender.readAll());
    auto completed = network::takeFrame(reply);
    REQUIRE(completed.is_ok());
    REQUIRE(completed.unwrap().has_value());
    REQUIRE(completed.unwrap()->type == network::MessageType::Completed);
}

TEST_CASE("ReceiverService withdraws when destroyed", "[integration][shutdown]") {
    QTemporaryDir dir;
    auto state = std::make_shared<FakeDiscoveryBackend::State>();
    {
        ReceiverService service(loopbackConfig(dir.path()), std::make_unique<FakeDiscoveryBackend>(state));
        if (service.start().is_err()) {
            SKIP("TCP listen not permitted in this environment");
        }
        REQUIRE(state->advertising);
    }
    REQUIRE_FALSE(state->advertising);
    REQUIRE(state->withdraw_calls == 1);
    REQUIRE(state->live == nullptr);
}
