#include <catch2/catch_test_macros.hpp>

#include "network/discovery_datagram.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>

using namespace manuscripts;
using namespace manuscripts::network;

TEST_CASE("UDP discovery datagram: encodes/decodes a receiver record", "[integration][network][discovery]") {
    ServiceRecord record;
    record.instance_id = Uuid::generate();
    record.display_name = QStringLiteral("Ms. Okafor");
    record.port = 8765;
    record.requires_passphrase = true;
    record.mode = ServiceMode::Share;

    const QHostAddress sender(QStringLiteral("192.168.50.10"));
    const auto decoded = decode_discovery_datagram(encode_discovery_datagram(record), sender);
    REQUIRE(decoded.is_ok());

    const auto& datagram = decoded.unwrap();
    REQUIRE_FALSE(datagram.bye);
    REQUIRE(datagram.record.instance_id == record.instance_id);
    REQUIRE(datagram.record.display_name == record.display_name);
    REQUIRE(datagram.record.host == sender);
    REQUIRE(datagram.record.port == record.port);
    REQUIRE(datagram.record.protocol_version == PROTOCOL_VERSION);
    REQUIRE(datagram.record.requires_passphrase);
    REQUIRE(datagram.record.mode == ServiceMode::Share);
}

TEST_CASE("UDP discovery datagram: bye marks a withdrawal", "[integration][network][discovery]") {
    ServiceRecord record;
    record.instance_id = Uuid::generate();
    record.display_name = QStringLiteral("Room 12");
    record.port = 9000;

    const auto decoded = decode_discovery_datagram(encode_discovery_datagram(record, true),
                                                   QHostAddress::LocalHost);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().bye);
    REQUIRE(decoded.unwrap().record.instance_id == record.instance_id);
}

TEST_CASE("UDP discovery datagram: rejects invalid json", "[integration][network][discovery]") {
    const QHostAddress sender(QStringLiteral("192.168.50.10"));
    const auto decoded = decode_discovery_datagram(QByteArray("not-json"), sender);
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.unwrap_err().code == ErrorCode::ProtocolMismatch);
}

TEST_CASE("UDP discovery datagram: rejects wrong message type", "[integration][network][discovery]") {
    const QHostAddress sender(QStringLiteral("192.168.50.10"));
    const auto decoded = decode_discovery_datagram(QByteArray("{\"t\":\"nope\"}"), sender);
    REQUIRE(decoded.is_err());
}

TEST_CASE("UDP discovery datagram: rejects bad ids and ports", "[integration][network][discovery]") {
    const QHostAddress sender(QStringLiteral("192.168.50.10"));

    ServiceRecord record;
    record.instance_id = Uuid::generate();
    record.port = 8765;
    auto obj = QJsonDocument::fromJson(encode_discovery_datagram(record)).object();

    SECTION("nil id") {
        obj["id"] = QStringLiteral("00000000-0000-0000-0000-000000000000");
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson(), sender).is_err());
    }

    SECTION("port out of range") {
        obj["port"] = 70000;
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson(), sender).is_err());
    }

    SECTION("unknown mode falls back to receiver") {
        obj["mode"] = QStringLiteral("lecture");
        const auto decoded = decode_discovery_datagram(QJsonDocument(obj).toJson(), sender);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().record.mode == ServiceMode::Receiver);
    }
}
