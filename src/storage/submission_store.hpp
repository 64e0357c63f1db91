#pragma once

#include "core/result.hpp"
#include "core/submission.hpp"

#include <QFile>
#include <QMutex>
#include <QString>
#include <memory>

namespace manuscripts::storage {

/**
 * PendingWrite - An in-progress submission body in a temp file.
 *
 * The temp file lives in the destination directory so commit() is a rename.
 * Destroying an uncommitted write removes its temp file.
 */
class PendingWrite {
public:
    ~PendingWrite();
    PendingWrite(const PendingWrite&) = delete;
    PendingWrite& operator=(const PendingWrite&) = delete;

    /**
     * Append body bytes. Fails with PersistenceFailure on I/O errors (disk
     * full, revoked permissions).
     */
    Result<void, Error> write(const char* data, qint64 len);

    [[nodiscard]] uint64_t bytesWritten() const { return bytes_written_; }
    [[nodiscard]] uint64_t expectedSize() const { return expected_size_; }
    [[nodiscard]] const QString& tempPath() const { return temp_path_; }
    [[nodiscard]] const QString& fileName() const { return file_name_; }
    [[nodiscard]] const QString& senderName() const { return sender_name_; }
    [[nodiscard]] bool isOpen() const { return stage_ == Stage::Open; }

private:
    friend class SubmissionStore;

    enum class Stage { Open, Committed, Aborted };

    PendingWrite(QString temp_path, QString file_name, QString sender_name, uint64_t expected_size);

    void discard();

    QFile file_;
    QString temp_path_;
    QString file_name_;
    QString sender_name_;
    uint64_t expected_size_ = 0;
    uint64_t bytes_written_ = 0;
    Stage stage_ = Stage::Open;
};

/**
 * SubmissionStore - Durable, collision-free persistence of received files.
 *
 * beginWrite() creates a temp file, commit() fsyncs it and renames it to the
 * first free name among "name.ext", "name (1).ext", "name (2).ext", ...
 * Final-name allocation is serialized; everything else runs concurrently.
 */
class SubmissionStore {
public:
    static constexpr int MAX_DISAMBIGUATOR = 9999;
    static constexpr int MAX_NAME_LENGTH = 120;

    explicit SubmissionStore(QString destination_dir);

    [[nodiscard]] const QString& destination() const { return destination_; }

    Result<std::unique_ptr<PendingWrite>, Error> beginWrite(const QString& file_name,
                                                           uint64_t expected_size,
                                                           const QString& sender_name = {});

    /**
     * Make the file visible under its final name. On failure the temp file is
     * removed and the handle is aborted.
     */
    Result<StoredFile, Error> commit(PendingWrite& handle);

    /**
     * Remove the temp file. Idempotent.
     */
    void abort(PendingWrite& handle);

    /**
     * Sanitized base name for a submission, before disambiguation:
     * "<SenderLastWord>-<file>" or just "<file>" when the sender is unknown.
     */
    [[nodiscard]] static QString finalNameFor(const QString& sender_name, const QString& file_name);

    /**
     * The n-th candidate for a base name: n == 0 is the name itself,
     * otherwise "stem (n).ext".
     */
    [[nodiscard]] static QString disambiguate(const QString& base_name, int n);

private:
    Result<void, Error> ensureDestination();
    Result<QString, Error> renameIntoPlace(const QString& temp_path, const QString& base_name);

    QString destination_;
    QMutex naming_mutex_;
};

} // namespace manuscripts::storage
