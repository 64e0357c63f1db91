#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QHostAddress>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include "app/logging.hpp"
#include "app/receiver_service.hpp"
#include "app/settings.hpp"
#include "app/signal_watcher.hpp"
#include "crypto/passphrase.hpp"
#include "network/discovery.hpp"
#include "network/submission_client.hpp"

namespace {

using namespace manuscripts;

constexpr int kBrowseWindowMs = 3000;

struct Options {
    QCommandLineOption name{QStringList{QStringLiteral("name")},
        QStringLiteral("Display name advertised to senders."), QStringLiteral("name")};
    QCommandLineOption passphraseStdin{QStringList{QStringLiteral("passphrase-stdin")},
        QStringLiteral("Read the passphrase from the first line of stdin "
                       "(MANUSCRIPTS_PASSPHRASE is used otherwise).")};
    QCommandLineOption port{QStringList{QStringLiteral("port")},
        QStringLiteral("Preferred TCP port (default 8765)."), QStringLiteral("port")};
    QCommandLineOption dest{QStringList{QStringLiteral("dest")},
        QStringLiteral("Directory received files are saved to."), QStringLiteral("dir")};
    QCommandLineOption mode{QStringList{QStringLiteral("mode")},
        QStringLiteral("Service mode: receiver or share."), QStringLiteral("mode")};
    QCommandLineOption discovery{QStringList{QStringLiteral("discovery")},
        QStringLiteral("Discovery backend: mdns or udp."), QStringLiteral("backend")};
    QCommandLineOption idleTimeout{QStringList{QStringLiteral("idle-timeout")},
        QStringLiteral("Seconds of silence before a submission is dropped (default 30)."),
        QStringLiteral("seconds")};
    QCommandLineOption grace{QStringList{QStringLiteral("grace")},
        QStringLiteral("Seconds in-flight submissions get on shutdown (default 5)."),
        QStringLiteral("seconds")};
    QCommandLineOption to{QStringList{QStringLiteral("to")},
        QStringLiteral("Receiver to send to: display name or host:port."), QStringLiteral("receiver")};
    QCommandLineOption sender{QStringList{QStringLiteral("sender")},
        QStringLiteral("Sender name shown to the receiver."), QStringLiteral("name")};
    QCommandLineOption debug{QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging.")};
    QCommandLineOption logFile{QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write the log here instead of the default location."), QStringLiteral("path")};
};

std::optional<std::string> read_passphrase(const QCommandLineParser& parser, const Options& opts) {
    QString text;
    if (parser.isSet(opts.passphraseStdin)) {
        QTextStream in(stdin);
        text = in.readLine();
    } else {
        text = qEnvironmentVariable("MANUSCRIPTS_PASSPHRASE");
    }
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return text.toStdString();
}

std::optional<network::DiscoveryKind> discovery_kind(const QCommandLineParser& parser,
                                                     const Options& opts) {
    if (!parser.isSet(opts.discovery)) {
        return network::default_discovery_kind();
    }
    return network::parse_discovery_kind(parser.value(opts.discovery));
}

std::optional<int> seconds_option(const QCommandLineParser& parser,
                                  const QCommandLineOption& option, int fallback) {
    if (!parser.isSet(option)) return fallback;
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value < 0) return std::nullopt;
    return value;
}

int fail_usage(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 2;
}

const char* describe(StatusEventKind kind) {
    switch (kind) {
        case StatusEventKind::Listening: return "listening";
        case StatusEventKind::SessionChanged: return "session";
        case StatusEventKind::ShuttingDown: return "shutting down";
        case StatusEventKind::ReceiverFault: return "fault";
    }
    return "?";
}

int run_receive(QCoreApplication& application, const QCommandLineParser& parser, const Options& opts) {
    QSettings settings;
    auto saved = app::load_receiver_settings(settings);

    if (parser.isSet(opts.mode)) {
        auto mode = network::parse_service_mode(parser.value(opts.mode));
        if (!mode) {
            return fail_usage(QStringLiteral("--mode must be 'receiver' or 'share'"));
        }
        if (*mode != saved.mode) {
            saved.display_name = app::default_display_name(*mode);
            saved.destination = app::default_destination(*mode);
        }
        saved.mode = *mode;
    }
    if (parser.isSet(opts.name) && !parser.value(opts.name).trimmed().isEmpty()) {
        saved.display_name = parser.value(opts.name).trimmed();
    }
    if (parser.isSet(opts.dest)) {
        saved.destination = QFileInfo(parser.value(opts.dest)).absoluteFilePath();
    }
    if (parser.isSet(opts.port)) {
        bool ok = false;
        const int port = parser.value(opts.port).toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            return fail_usage(QStringLiteral("--port must be between 0 and 65535"));
        }
        saved.port = static_cast<uint16_t>(port);
    }

    const auto kind = discovery_kind(parser, opts);
    const auto idle = seconds_option(parser, opts.idleTimeout, 30);
    const auto grace = seconds_option(parser, opts.grace, 5);
    if (!kind) return fail_usage(QStringLiteral("--discovery must be 'mdns' or 'udp'"));
    if (!idle || *idle == 0) return fail_usage(QStringLiteral("--idle-timeout must be a positive number"));
    if (!grace) return fail_usage(QStringLiteral("--grace must not be negative"));

    app::ReceiverConfig config;
    config.display_name = saved.display_name;
    config.passphrase = read_passphrase(parser, opts);
    config.port = saved.port;
    config.destination = saved.destination;
    config.mode = saved.mode;
    config.instance_id = saved.instance_id;
    config.discovery = *kind;
    config.idle_timeout = std::chrono::seconds(*idle);
    config.grace = std::chrono::seconds(*grace);

    app::ReceiverService service(std::move(config));
    service.bus().subscribe([&service](const StatusEvent& event) {
        if (event.kind != StatusEventKind::SessionChanged) {
            qInfo().noquote() << "Receiver" << describe(event.kind) << event.failure_reason;
            return;
        }
        if (event.state == SessionState::Succeeded && event.stored) {
            qInfo().noquote() << "Received" << event.file_name << "from" << event.sender_name
                              << "->" << event.stored->final_path
                              << QStringLiteral("(%1 total)").arg(service.bus().succeededCount());
        } else if (event.state == SessionState::Failed && event.failure) {
            qInfo().noquote() << "Submission" << event.file_name << "from" << event.sender_name
                              << "failed:" << error_code_name(*event.failure) << event.failure_reason;
        }
    });

    auto started = service.start();
    if (started.is_err()) {
        qCritical() << "Failed to start receiver:" << started.unwrap_err().message.c_str();
        return 1;
    }

    app::save_receiver_settings(settings, saved);

    QTextStream(stdout) << QStringLiteral("%1 is accepting submissions on port %2 (saving to %3)\n")
                               .arg(service.record().display_name)
                               .arg(started.unwrap())
                               .arg(service.store().destination());

    int exit_code = 0;
    app::SignalWatcher watcher;
    QObject::connect(&watcher, &app::SignalWatcher::terminationRequested,
                     &service, [&service](int signal_number) {
        qInfo() << "Signal" << signal_number << "received, shutting down";
        service.stop();
    });
    QObject::connect(&service, &app::ReceiverService::advertisementFailed,
                     &service, [&service, &exit_code](const QString& message) {
        qCritical().noquote() << "Advertisement failed:" << message;
        exit_code = 1;
        service.stop();
    });
    QObject::connect(&service, &app::ReceiverService::stopped, &application, &QCoreApplication::quit);

    const int loop_code = application.exec();
    return exit_code != 0 ? exit_code : loop_code;
}

std::optional<std::pair<QHostAddress, uint16_t>> parse_endpoint(const QString& text) {
    const int colon = text.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) return std::nullopt;

    QHostAddress host;
    if (!host.setAddress(text.left(colon))) return std::nullopt;

    bool ok = false;
    const int port = text.mid(colon + 1).toInt(&ok);
    if (!ok || port <= 0 || port > 65535) return std::nullopt;
    return std::make_pair(host, static_cast<uint16_t>(port));
}

int run_send(QCoreApplication& application, const QCommandLineParser& parser, const Options& opts,
             const QString& path) {
    if (!QFileInfo(path).isFile()) {
        return fail_usage(QStringLiteral("No such file: %1").arg(path));
    }
    const auto kind = discovery_kind(parser, opts);
    if (!kind) return fail_usage(QStringLiteral("--discovery must be 'mdns' or 'udp'"));

    const QString target = parser.value(opts.to);
    const QString sender_name = parser.value(opts.sender);

    network::SubmissionClient client;
    client.setPassphrase(read_passphrase(parser, opts));

    int exit_code = 1;
    QObject::connect(&client, &network::SubmissionClient::finished, &application,
                     [&application, &exit_code](const network::SubmissionOutcome& outcome) {
        if (outcome.succeeded) {
            QTextStream(stdout) << QStringLiteral("Delivered as %1\n").arg(outcome.completion.stored_name);
            exit_code = 0;
        } else {
            QTextStream(stderr) << QStringLiteral("Submission failed: %1: %2\n")
                                       .arg(QString::fromLatin1(error_code_name(outcome.error.code)),
                                            QString::fromStdString(outcome.error.message));
        }
        application.quit();
    });

    auto send_to = [&](const QHostAddress& host, uint16_t port) {
        qInfo() << "Sending" << path << "to" << host.toString() << port;
        auto started = client.submitFile(host, port, sender_name, path);
        if (started.is_err()) {
            QTextStream(stderr) << QString::fromStdString(started.unwrap_err().message) << '\n';
            application.exit(1);
        }
    };

    if (auto endpoint = parse_endpoint(target)) {
        QTimer::singleShot(0, &application, [&, endpoint]() { send_to(endpoint->first, endpoint->second); });
        application.exec();
        return exit_code;
    }

    network::ServiceBrowser browser(network::createDiscoveryBackend(*kind));
    bool chosen = false;
    auto choose = [&](const network::ServiceRecord& record) {
        if (chosen) return;
        chosen = true;
        browser.stop();
        send_to(record.host, record.port);
    };

    QObject::connect(&browser, &network::ServiceBrowser::recordAdded, &application,
                     [&](const network::ServiceRecord& record) {
        if (!target.isEmpty() && record.display_name.compare(target, Qt::CaseInsensitive) == 0) {
            choose(record);
        }
    });
    QTimer::singleShot(kBrowseWindowMs, &application, [&]() {
        if (chosen) return;
        const auto records = browser.records();
        if (target.isEmpty() && records.size() == 1) {
            choose(records.front());
            return;
        }
        QTextStream err(stderr);
        if (records.empty()) {
            err << "No receivers found\n";
        } else {
            err << (target.isEmpty() ? "Several receivers found; pick one with --to:\n"
                                     : "Receiver not found; visible receivers:\n");
            for (const auto& record : records) {
                err << "  " << record.display_name << '\n';
            }
        }
        application.exit(1);
    });

    auto browsing = browser.start();
    if (browsing.is_err()) {
        qCritical() << "Discovery unavailable:" << browsing.unwrap_err().message.c_str();
        return 1;
    }

    const int loop_code = application.exec();
    return chosen ? exit_code : loop_code;
}

int run_browse(QCoreApplication& application, const QCommandLineParser& parser, const Options& opts) {
    const auto kind = discovery_kind(parser, opts);
    if (!kind) return fail_usage(QStringLiteral("--discovery must be 'mdns' or 'udp'"));

    network::ServiceBrowser browser(network::createDiscoveryBackend(*kind));
    QObject::connect(&browser, &network::ServiceBrowser::recordAdded, &application,
                     [](const network::ServiceRecord& record) {
        QTextStream(stdout) << QStringLiteral("+ %1  %2:%3  %4%5\n")
                                   .arg(record.display_name, record.host.toString())
                                   .arg(record.port)
                                   .arg(QString::fromLatin1(network::service_mode_name(record.mode)),
                                        record.requires_passphrase ? QStringLiteral(" (passphrase)")
                                                                   : QString());
    });
    QObject::connect(&browser, &network::ServiceBrowser::recordRemoved, &application,
                     [](const network::ServiceRecord& record) {
        QTextStream(stdout) << QStringLiteral("- %1\n").arg(record.display_name);
    });

    auto browsing = browser.start();
    if (browsing.is_err()) {
        qCritical() << "Discovery unavailable:" << browsing.unwrap_err().message.c_str();
        return 1;
    }

    app::SignalWatcher watcher;
    QObject::connect(&watcher, &app::SignalWatcher::terminationRequested,
                     &application, &QCoreApplication::quit);
    return application.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("manuscripts");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("manuscripts");
    app.setOrganizationDomain("manuscripts.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Receive finished manuscripts over the local network."));
    parser.addHelpOption();
    parser.addVersionOption();

    const Options opts;
    parser.addOptions({opts.name, opts.passphraseStdin, opts.port, opts.dest, opts.mode,
                       opts.discovery, opts.idleTimeout, opts.grace, opts.to, opts.sender,
                       opts.debug, opts.logFile});

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("receive (default), send <file>, or browse."));
    parser.process(app);

    // Install logging early so startup failures end up in the log.
    manuscripts::app::LogOptions log_options;
    log_options.file_path = parser.value(opts.logFile);
    log_options.debug = parser.isSet(opts.debug);
    auto logging = manuscripts::app::install_logging(log_options);
    if (logging.is_ok()) {
        qInfo() << "manuscripts: logging to" << logging.unwrap();
    } else {
        qWarning() << "manuscripts: logging to stderr only:" << logging.unwrap_err().message.c_str();
    }

    // Initialize crypto
    auto crypto_result = manuscripts::crypto::init();
    if (crypto_result.is_err()) {
        qCritical() << "Failed to initialize crypto:"
                    << crypto_result.unwrap_err().message.c_str();
        return 1;
    }

    const auto positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QStringLiteral("receive") : positional.first();

    if (command == QStringLiteral("receive")) {
        return run_receive(app, parser, opts);
    }
    if (command == QStringLiteral("send")) {
        if (positional.size() < 2) {
            return fail_usage(QStringLiteral("Usage: manuscripts send <file> [--to <receiver>]"));
        }
        return run_send(app, parser, opts, positional.at(1));
    }
    if (command == QStringLiteral("browse")) {
        return run_browse(app, parser, opts);
    }

    return fail_usage(QStringLiteral("Unknown command '%1'").arg(command));
}
