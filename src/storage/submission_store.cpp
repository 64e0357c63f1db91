#include "storage/submission_store.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QRegularExpression>

#include <algorithm>

#ifdef Q_OS_UNIX
#include <fcntl.h>
#include <unistd.h>
#endif

Q_LOGGING_CATEGORY(storageLog, "manuscripts.storage")

namespace manuscripts::storage {
namespace {

constexpr int kMaxSenderPrefix = 30;
constexpr int kMaxSuffix = 16;

QString strip_unsafe(const QString& text) {
    QString out;
    out.reserve(text.size());
    for (const QChar c : text) {
        if (c.unicode() < 0x20 || c.unicode() == 0x7F) continue;
        switch (c.unicode()) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                continue;
            default:
                out += c;
        }
    }
    // No hidden files and no trailing dots or blanks.
    while (!out.isEmpty() && (out.front() == QLatin1Char('.') || out.front().isSpace())) {
        out.remove(0, 1);
    }
    while (!out.isEmpty() && (out.back() == QLatin1Char('.') || out.back().isSpace())) {
        out.chop(1);
    }
    return out;
}

QString last_path_component(const QString& name) {
    const auto slash = std::max(name.lastIndexOf(QLatin1Char('/')), name.lastIndexOf(QLatin1Char('\\')));
    return slash >= 0 ? name.mid(slash + 1) : name;
}

QString sender_prefix(const QString& sender_name) {
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));
    static const QRegularExpression kNotWord(QStringLiteral("[^\\w\\-]"),
                                             QRegularExpression::UseUnicodePropertiesOption);
    const auto words = sender_name.trimmed().split(kWhitespace, Qt::SkipEmptyParts);
    if (words.isEmpty()) return {};
    QString last = words.back();
    last.remove(kNotWord);
    return last.left(kMaxSenderPrefix);
}

void sync_directory(const QString& dir) {
#ifdef Q_OS_UNIX
    const auto path = QFile::encodeName(dir);
    const int fd = ::open(path.constData(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    if (::fsync(fd) != 0) {
        qCWarning(storageLog) << "fsync of directory failed:" << dir;
    }
    ::close(fd);
#else
    Q_UNUSED(dir)
#endif
}

} // namespace

// ============================================================================
// PendingWrite
// ============================================================================

PendingWrite::PendingWrite(QString temp_path, QString file_name, QString sender_name, uint64_t expected_size)
    : file_(temp_path)
    , temp_path_(std::move(temp_path))
    , file_name_(std::move(file_name))
    , sender_name_(std::move(sender_name))
    , expected_size_(expected_size)
{
}

PendingWrite::~PendingWrite() {
    discard();
}

Result<void, Error> PendingWrite::write(const char* data, qint64 len) {
    if (stage_ != Stage::Open) {
        return Result<void, Error>::fail(ErrorCode::PersistenceFailure, "Write handle is closed");
    }
    qint64 done = 0;
    while (done < len) {
        const qint64 n = file_.write(data + done, len - done);
        if (n <= 0) {
            return Result<void, Error>::fail(ErrorCode::PersistenceFailure,
                                             "Write failed: " + file_.errorString().toStdString());
        }
        done += n;
    }
    bytes_written_ += static_cast<uint64_t>(len);
    return Result<void, Error>::ok();
}

void PendingWrite::discard() {
    if (stage_ != Stage::Open) return;
    stage_ = Stage::Aborted;
    file_.close();
    if (QFile::exists(temp_path_) && !QFile::remove(temp_path_)) {
        qCWarning(storageLog) << "Could not remove temp file" << temp_path_;
    }
}

// ============================================================================
// SubmissionStore
// ============================================================================

SubmissionStore::SubmissionStore(QString destination_dir)
    : destination_(QDir::cleanPath(std::move(destination_dir)))
{
}

Result<void, Error> SubmissionStore::ensureDestination() {
    if (QDir().mkpath(destination_)) {
        return Result<void, Error>::ok();
    }
    return Result<void, Error>::fail(ErrorCode::PersistenceFailure,
                                     "Cannot create destination directory " + destination_.toStdString());
}

Result<std::unique_ptr<PendingWrite>, Error> SubmissionStore::beginWrite(const QString& file_name,
                                                                        uint64_t expected_size,
                                                                        const QString& sender_name) {
    using R = Result<std::unique_ptr<PendingWrite>, Error>;

    auto dir = ensureDestination();
    if (dir.is_err()) {
        return R::err(dir.unwrap_err());
    }

    const auto temp_path = QDir(destination_).filePath(
        QStringLiteral(".manuscripts-%1.part").arg(QString::fromStdString(Uuid::generate().to_string())));

    std::unique_ptr<PendingWrite> handle(new PendingWrite(temp_path, file_name, sender_name, expected_size));
    if (!handle->file_.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        const auto reason = handle->file_.errorString().toStdString();
        handle->stage_ = PendingWrite::Stage::Aborted;
        return R::fail(ErrorCode::PersistenceFailure, "Cannot create temp file: " + reason);
    }

    qCDebug(storageLog) << "beginWrite" << file_name << "expected" << expected_size << "temp" << temp_path;
    return R::ok(std::move(handle));
}

Result<StoredFile, Error> SubmissionStore::commit(PendingWrite& handle) {
    using R = Result<StoredFile, Error>;

    if (!handle.isOpen()) {
        return R::fail(ErrorCode::PersistenceFailure, "Write handle is not open");
    }
    if (handle.bytes_written_ != handle.expected_size_) {
        handle.discard();
        return R::fail(ErrorCode::PersistenceFailure, "Received size does not match declared size");
    }

    if (!handle.file_.flush()) {
        const auto reason = handle.file_.errorString().toStdString();
        handle.discard();
        return R::fail(ErrorCode::PersistenceFailure, "Flush failed: " + reason);
    }
#ifdef Q_OS_UNIX
    if (::fsync(handle.file_.handle()) != 0) {
        handle.discard();
        return R::fail(ErrorCode::PersistenceFailure, "fsync failed");
    }
#endif
    handle.file_.close();

    const auto base = finalNameFor(handle.sender_name_, handle.file_name_);
    auto final_path = renameIntoPlace(handle.temp_path_, base);
    if (final_path.is_err()) {
        handle.discard();
        return R::err(final_path.unwrap_err());
    }
    handle.stage_ = PendingWrite::Stage::Committed;
    sync_directory(destination_);

    StoredFile stored;
    stored.final_path = final_path.unwrap();
    stored.original_file_name = handle.file_name_;
    stored.sender_name = handle.sender_name_;
    stored.size_bytes = handle.bytes_written_;
    stored.received_at = Timestamp::now();

    qCInfo(storageLog) << "committed" << stored.final_path << stored.size_bytes << "bytes";
    return R::ok(std::move(stored));
}

void SubmissionStore::abort(PendingWrite& handle) {
    handle.discard();
}

Result<QString, Error> SubmissionStore::renameIntoPlace(const QString& temp_path, const QString& base_name) {
    QMutexLocker lock(&naming_mutex_);
    const QDir dir(destination_);

    for (int n = 0; n <= MAX_DISAMBIGUATOR; ++n) {
        const auto candidate = dir.filePath(disambiguate(base_name, n));
        if (QFileInfo::exists(candidate)) {
            continue;
        }
        // QFile::rename never replaces an existing target.
        if (QFile::rename(temp_path, candidate)) {
            return Result<QString, Error>::ok(candidate);
        }
        if (QFileInfo::exists(candidate)) {
            continue;
        }
        return Result<QString, Error>::fail(ErrorCode::PersistenceFailure,
                                            "Rename into " + candidate.toStdString() + " failed");
    }
    return Result<QString, Error>::fail(ErrorCode::PersistenceFailure,
                                        "No free name left for " + base_name.toStdString());
}

QString SubmissionStore::finalNameFor(const QString& sender_name, const QString& file_name) {
    const auto name = strip_unsafe(last_path_component(file_name));

    QString stem = name;
    QString suffix;
    const auto dot = name.lastIndexOf(QLatin1Char('.'));
    if (dot > 0) {
        stem = strip_unsafe(name.left(dot));
        suffix = strip_unsafe(name.mid(dot + 1)).left(kMaxSuffix);
    }
    if (stem.isEmpty()) {
        stem = QStringLiteral("Untitled");
    }

    QString prefix = sender_prefix(sender_name);
    if (!prefix.isEmpty()) prefix += QLatin1Char('-');

    const int budget = MAX_NAME_LENGTH - static_cast<int>(prefix.size())
                     - (suffix.isEmpty() ? 0 : static_cast<int>(suffix.size()) + 1);
    stem = stem.left(std::max(budget, 1));

    return suffix.isEmpty() ? prefix + stem : prefix + stem + QLatin1Char('.') + suffix;
}

QString SubmissionStore::disambiguate(const QString& base_name, int n) {
    if (n == 0) return base_name;
    const auto dot = base_name.lastIndexOf(QLatin1Char('.'));
    if (dot > 0) {
        return base_name.left(dot) + QStringLiteral(" (%1)").arg(n) + base_name.mid(dot);
    }
    return base_name + QStringLiteral(" (%1)").arg(n);
}

} // namespace manuscripts::storage
