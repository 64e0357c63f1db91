#include "network/discovery_datagram.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>

namespace manuscripts::network {
namespace {

constexpr const char* kMsgType = "manuscripts";

QJsonObject to_json(const ServiceRecord& record, bool bye) {
    QJsonObject obj;
    obj["t"] = QString::fromLatin1(kMsgType);
    obj["v"] = record.protocol_version;
    obj["id"] = QString::fromStdString(record.instance_id.to_string());
    obj["name"] = record.display_name;
    obj["port"] = static_cast<int>(record.port);
    obj["auth"] = record.requires_passphrase;
    obj["mode"] = QString::fromLatin1(service_mode_name(record.mode));
    obj["ts"] = QDateTime::currentMSecsSinceEpoch();
    if (bye) {
        obj["bye"] = true;
    }
    return obj;
}

} // namespace

QByteArray encode_discovery_datagram(const ServiceRecord& record, bool bye) {
    return QJsonDocument(to_json(record, bye)).toJson(QJsonDocument::Compact);
}

Result<DiscoveryDatagram, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                           const QHostAddress& sender) {
    using R = Result<DiscoveryDatagram, Error>;

    const auto doc = QJsonDocument::fromJson(datagram);
    if (doc.isNull() || !doc.isObject()) {
        return R::fail(ErrorCode::ProtocolMismatch, "invalid json");
    }

    const auto obj = doc.object();
    if (obj["t"].toString() != QString::fromLatin1(kMsgType)) {
        return R::fail(ErrorCode::ProtocolMismatch, "wrong message type");
    }
    if (!obj.contains("id") || !obj.contains("port") || !obj.contains("v")) {
        return R::fail(ErrorCode::ProtocolMismatch, "missing fields");
    }

    auto id = Uuid::parse(obj["id"].toString().toStdString());
    if (!id || id->is_nil()) {
        return R::fail(ErrorCode::ProtocolMismatch, "invalid instance id");
    }

    const int port_int = obj["port"].toInt();
    if (port_int <= 0 || port_int > 65535) {
        return R::fail(ErrorCode::ProtocolMismatch, "invalid port");
    }

    DiscoveryDatagram out;
    out.record.instance_id = *id;
    out.record.display_name = obj["name"].toString();
    out.record.host = sender;
    out.record.port = static_cast<uint16_t>(port_int);
    out.record.protocol_version = obj["v"].toInt();
    out.record.requires_passphrase = obj["auth"].toBool();
    // Unknown modes from newer senders are shown as plain receivers.
    out.record.mode = parse_service_mode(obj["mode"].toString()).value_or(ServiceMode::Receiver);
    out.bye = obj["bye"].toBool();

    return R::ok(std::move(out));
}

} // namespace manuscripts::network
