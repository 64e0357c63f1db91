#include <catch2/catch_test_macros.hpp>

#include "storage/submission_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTemporaryDir>

#include <thread>
#include <vector>

using namespace manuscripts;
using namespace manuscripts::storage;

namespace {

QStringList partFiles(const QString& dir) {
    return QDir(dir).entryList({QStringLiteral("*.part")}, QDir::Files | QDir::Hidden);
}

QStringList visibleFiles(const QString& dir) {
    return QDir(dir).entryList(QDir::Files, QDir::Name);
}

Result<StoredFile, Error> storeBytes(SubmissionStore& store, const QString& name,
                                     const QByteArray& bytes, const QString& sender = {}) {
    auto pending = store.beginWrite(name, static_cast<uint64_t>(bytes.size()), sender);
    if (pending.is_err()) {
        return Result<StoredFile, Error>::err(pending.unwrap_err());
    }
    auto handle = std::move(pending).unwrap();
    auto written = handle->write(bytes.constData(), bytes.size());
    if (written.is_err()) {
        return Result<StoredFile, Error>::err(written.unwrap_err());
    }
    return store.commit(*handle);
}

} // namespace

TEST_CASE("SubmissionStore commits under the original name", "[storage]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    SubmissionStore store(tmp.filePath(QStringLiteral("inbox")));

    const QByteArray body(4096, 'x');
    auto stored = storeBytes(store, QStringLiteral("essay.pdf"), body);
    REQUIRE(stored.is_ok());

    const auto& file = stored.unwrap();
    REQUIRE(QFileInfo(file.final_path).fileName() == QStringLiteral("essay.pdf"));
    REQUIRE(QFileInfo(file.final_path).size() == body.size());
    REQUIRE(file.size_bytes == 4096);
    REQUIRE(file.original_file_name == QStringLiteral("essay.pdf"));
    REQUIRE(partFiles(store.destination()).isEmpty());
}

TEST_CASE("SubmissionStore never overwrites", "[storage]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    REQUIRE(storeBytes(store, QStringLiteral("essay.pdf"), QByteArray("first")).is_ok());
    auto second = storeBytes(store, QStringLiteral("essay.pdf"), QByteArray("second"));
    auto third = storeBytes(store, QStringLiteral("essay.pdf"), QByteArray("third"));
    REQUIRE(second.is_ok());
    REQUIRE(third.is_ok());

    REQUIRE(QFileInfo(second.unwrap().final_path).fileName() == QStringLiteral("essay (1).pdf"));
    REQUIRE(QFileInfo(third.unwrap().final_path).fileName() == QStringLiteral("essay (2).pdf"));

    QFile original(tmp.filePath(QStringLiteral("essay.pdf")));
    REQUIRE(original.open(QIODevice::ReadOnly));
    REQUIRE(original.readAll() == QByteArray("first"));
}

TEST_CASE("SubmissionStore: concurrent commits with colliding names", "[storage][concurrency]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    constexpr int kWriters = 50;
    std::vector<QString> paths(kWriters);
    std::vector<char> ok(kWriters, 0);
    std::vector<std::thread> threads;
    threads.reserve(kWriters);

    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i] {
            const QByteArray body = QByteArray::number(i).repeated(100);
            auto stored = storeBytes(store, QStringLiteral("essay.pdf"), body);
            if (stored.is_ok()) {
                ok[i] = 1;
                paths[i] = stored.unwrap().final_path;
            }
        });
    }
    for (auto& t : threads) t.join();

    QSet<QString> distinct;
    for (int i = 0; i < kWriters; ++i) {
        REQUIRE(ok[i]);
        distinct.insert(paths[i]);
    }
    REQUIRE(distinct.size() == kWriters);
    REQUIRE(visibleFiles(tmp.path()).size() == kWriters);
    REQUIRE(partFiles(tmp.path()).isEmpty());
}

TEST_CASE("SubmissionStore: abort removes the temp file", "[storage]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    auto pending = store.beginWrite(QStringLiteral("draft.docx"), 10);
    REQUIRE(pending.is_ok());
    auto handle = std::move(pending).unwrap();
    REQUIRE(handle->write("12345", 5).is_ok());
    REQUIRE(QFile::exists(handle->tempPath()));
    REQUIRE(QFileInfo(handle->tempPath()).fileName().endsWith(QStringLiteral(".part")));

    store.abort(*handle);
    REQUIRE_FALSE(QFile::exists(handle->tempPath()));

    // Second abort is harmless.
    store.abort(*handle);
    REQUIRE(visibleFiles(tmp.path()).isEmpty());
    REQUIRE(partFiles(tmp.path()).isEmpty());

    SECTION("an aborted handle cannot be committed") {
        auto committed = store.commit(*handle);
        REQUIRE(committed.is_err());
        REQUIRE(committed.unwrap_err().code == ErrorCode::PersistenceFailure);
    }
}

TEST_CASE("SubmissionStore: size mismatch is not committed", "[storage]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    auto handle = store.beginWrite(QStringLiteral("short.txt"), 100).unwrap();
    REQUIRE(handle->write("abc", 3).is_ok());

    auto committed = store.commit(*handle);
    REQUIRE(committed.is_err());
    REQUIRE(committed.unwrap_err().code == ErrorCode::PersistenceFailure);
    REQUIRE(visibleFiles(tmp.path()).isEmpty());
    REQUIRE(partFiles(tmp.path()).isEmpty());
}

TEST_CASE("SubmissionStore: dropping a pending write cleans up", "[storage]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    QString temp_path;
    {
        auto handle = store.beginWrite(QStringLiteral("lost.txt"), 3).unwrap();
        temp_path = handle->tempPath();
        REQUIRE(QFile::exists(temp_path));
    }
    REQUIRE_FALSE(QFile::exists(temp_path));
}

TEST_CASE("SubmissionStore: empty file", "[storage]") {
    QTemporaryDir tmp;
    SubmissionStore store(tmp.path());

    auto stored = storeBytes(store, QStringLiteral("empty.txt"), QByteArray());
    REQUIRE(stored.is_ok());
    REQUIRE(QFileInfo(stored.unwrap().final_path).size() == 0);
}

TEST_CASE("SubmissionStore: unwritable destination", "[storage]") {
    QTemporaryDir tmp;
    const auto blocker = tmp.filePath(QStringLiteral("not-a-dir"));
    QFile file(blocker);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.close();

    SubmissionStore store(blocker + QStringLiteral("/inbox"));
    auto pending = store.beginWrite(QStringLiteral("essay.pdf"), 1);
    REQUIRE(pending.is_err());
    REQUIRE(pending.unwrap_err().code == ErrorCode::PersistenceFailure);
}

TEST_CASE("SubmissionStore: final names", "[storage]") {
    SECTION("sender's last word prefixes the file") {
        REQUIRE(SubmissionStore::finalNameFor(QStringLiteral("Ada Okafor"), QStringLiteral("essay.pdf"))
                == QStringLiteral("Okafor-essay.pdf"));
    }

    SECTION("no sender, no prefix") {
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral("essay.pdf"))
                == QStringLiteral("essay.pdf"));
    }

    SECTION("path components are dropped") {
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral("../../etc/passwd"))
                == QStringLiteral("passwd"));
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral("C:\\Users\\kid\\hw.doc"))
                == QStringLiteral("hw.doc"));
    }

    SECTION("unsafe characters are stripped") {
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral("what?*.txt"))
                == QStringLiteral("what.txt"));
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral(".hidden"))
                == QStringLiteral("hidden"));
    }

    SECTION("empty stem becomes Untitled") {
        REQUIRE(SubmissionStore::finalNameFor(QString(), QStringLiteral("???")) == QStringLiteral("Untitled"));
    }

    SECTION("long names are capped") {
        const QString long_name = QString(300, QLatin1Char('a')) + QStringLiteral(".pdf");
        const auto name = SubmissionStore::finalNameFor(QStringLiteral("Room 204"), long_name);
        REQUIRE(name.size() <= SubmissionStore::MAX_NAME_LENGTH);
        REQUIRE(name.startsWith(QStringLiteral("204-")));
        REQUIRE(name.endsWith(QStringLiteral(".pdf")));
    }

    SECTION("disambiguation keeps the extension") {
        REQUIRE(SubmissionStore::disambiguate(QStringLiteral("essay.pdf"), 0) == QStringLiteral("essay.pdf"));
        REQUIRE(SubmissionStore::disambiguate(QStringLiteral("essay.pdf"), 3) == QStringLiteral("essay (3).pdf"));
        REQUIRE(SubmissionStore::disambiguate(QStringLiteral("README"), 1) == QStringLiteral("README (1)"));
    }
}
