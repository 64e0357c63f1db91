#include <QBuffer>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QTemporaryDir>
#include <QTimer>

#include "core/identity.hpp"
#include "core/status_bus.hpp"
#include "crypto/passphrase.hpp"
#include "network/submission_client.hpp"
#include "network/submission_server.hpp"
#include "storage/submission_store.hpp"

// Loopback check: one receiver with a passphrase, one sender, one file.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    if (manuscripts::crypto::init().is_err()) {
        qCritical() << "libsodium unavailable";
        return 1;
    }

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qCritical() << "Cannot create a temporary directory";
        return 1;
    }

    manuscripts::CredentialStore credentials;
    auto configured = credentials.configure(QStringLiteral("Smoke Receiver"),
                                            std::string("correct horse"),
                                            manuscripts::crypto::KdfParams::minimum());
    if (configured.is_err()) {
        qCritical() << "configure:" << configured.unwrap_err().message.c_str();
        return 1;
    }

    manuscripts::storage::SubmissionStore store(dir.path());
    manuscripts::StatusEventBus bus;
    manuscripts::network::SubmissionServer server(credentials, store, bus);

    auto port = server.listen(0, QHostAddress::LocalHost);
    if (port.is_err()) {
        qCritical() << "listen:" << port.unwrap_err().message.c_str();
        return 1;
    }

    const QByteArray body(150 * 1024, 'm');
    auto buffer = std::make_unique<QBuffer>();
    buffer->setData(body);
    buffer->open(QIODevice::ReadOnly);

    manuscripts::network::SubmissionRequest request;
    request.sender_name = QStringLiteral("Smoke Test");
    request.file_name = QStringLiteral("smoke.pdf");
    request.size_bytes = static_cast<uint64_t>(body.size());

    manuscripts::network::SubmissionClient client;
    client.setPassphrase(std::string("correct horse"));

    int exit_code = 1;
    QObject::connect(&client, &manuscripts::network::SubmissionClient::finished, &app,
                     [&](const manuscripts::network::SubmissionOutcome& outcome) {
        if (!outcome.succeeded) {
            qCritical() << "submission failed:"
                        << manuscripts::error_code_name(outcome.error.code)
                        << outcome.error.message.c_str();
        } else {
            QFile stored(dir.filePath(outcome.completion.stored_name));
            if (stored.size() == body.size()) {
                qInfo().noquote() << "stored" << outcome.completion.stored_name;
                exit_code = 0;
            } else {
                qCritical() << "stored size" << stored.size() << "expected" << body.size();
            }
        }
        app.quit();
    });

    QTimer::singleShot(20000, &app, [&app]() {
        qCritical() << "timed out";
        app.quit();
    });

    client.submit(QHostAddress::LocalHost, port.unwrap(), request, std::move(buffer));
    app.exec();
    return exit_code;
}
