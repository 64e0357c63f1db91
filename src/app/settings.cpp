#include "app/settings.hpp"

#include <QDir>
#include <QHostInfo>
#include <QStandardPaths>

namespace manuscripts::app {
namespace {

constexpr const char* kSettingsName = "receiver/name";
constexpr const char* kSettingsPort = "receiver/port";
constexpr const char* kSettingsDestination = "receiver/destination";
constexpr const char* kSettingsMode = "receiver/mode";
constexpr const char* kSettingsInstanceId = "receiver/instance_id";

QString downloads_dir() {
    auto downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (downloads.isEmpty()) {
        downloads = QDir::home().filePath(QStringLiteral("Downloads"));
    }
    return downloads;
}

} // namespace

QString default_destination(network::ServiceMode mode) {
    const auto leaf = mode == network::ServiceMode::Share ? QStringLiteral("Shared")
                                                          : QStringLiteral("Submissions");
    return QDir(downloads_dir()).filePath(leaf);
}

QString default_display_name(network::ServiceMode mode) {
    if (mode == network::ServiceMode::Share) {
        const auto host = QHostInfo::localHostName();
        if (!host.isEmpty()) return host;
    }
    return QStringLiteral("Teacher");
}

Uuid get_or_create_instance_id(QSettings& settings) {
    const QString key = QString::fromLatin1(kSettingsInstanceId);
    const QString stored = settings.value(key).toString();
    if (!stored.isEmpty()) {
        auto parsed = Uuid::parse(stored.toStdString());
        if (parsed && !parsed->is_nil()) {
            return *parsed;
        }
    }
    auto id = Uuid::generate();
    settings.setValue(key, QString::fromStdString(id.to_string()));
    return id;
}

ReceiverSettings load_receiver_settings(QSettings& settings) {
    ReceiverSettings out;

    out.mode = network::parse_service_mode(
                   settings.value(QString::fromLatin1(kSettingsMode)).toString())
                   .value_or(network::ServiceMode::Receiver);

    out.display_name = settings.value(QString::fromLatin1(kSettingsName)).toString().trimmed();
    if (out.display_name.isEmpty()) {
        out.display_name = default_display_name(out.mode);
    }

    bool ok = false;
    const int port = settings.value(QString::fromLatin1(kSettingsPort), DEFAULT_PORT).toInt(&ok);
    out.port = (ok && port >= 0 && port <= 65535) ? static_cast<uint16_t>(port) : DEFAULT_PORT;

    out.destination = settings.value(QString::fromLatin1(kSettingsDestination)).toString();
    if (out.destination.isEmpty()) {
        out.destination = default_destination(out.mode);
    }

    out.instance_id = get_or_create_instance_id(settings);
    return out;
}

void save_receiver_settings(QSettings& settings, const ReceiverSettings& values) {
    settings.setValue(QString::fromLatin1(kSettingsName), values.display_name);
    settings.setValue(QString::fromLatin1(kSettingsPort), static_cast<int>(values.port));
    settings.setValue(QString::fromLatin1(kSettingsDestination), values.destination);
    settings.setValue(QString::fromLatin1(kSettingsMode),
                      QString::fromLatin1(network::service_mode_name(values.mode)));
    if (!values.instance_id.is_nil()) {
        settings.setValue(QString::fromLatin1(kSettingsInstanceId),
                          QString::fromStdString(values.instance_id.to_string()));
    }
    settings.sync();
}

} // namespace manuscripts::app
