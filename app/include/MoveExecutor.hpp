#ifndef MOVE_EXECUTOR_HPP
#define MOVE_EXECUTOR_HPP

#include "MediaTypes.hpp"
#include "RelocationIssue.hpp"
#include <QString>
#include <QStringList>
#include <functional>

enum class RenameOutcome {
    Renamed,
    CrossDevice,   // source and destination live on different volumes
    Failed
};

struct MoveResult {
    int files_moved = 0;
    int companions_moved = 0;
    int errors = 0;
    qint64 bytes_total = 0;
    qint64 bytes_done = 0;
    IssueList issues;      // MoveError only
    bool success = true;
};

// Relocates planned items one after the other. A rename is tried first;
// when the volumes differ the file is copied in chunks and the source removed.
// A failure on one file is recorded and the batch carries on.
class MoveExecutor {
public:
    // bytes_done never decreases within one apply() call.
    using ProgressCallback = std::function<void(qint64 bytes_done, qint64 bytes_total, const QString& label)>;
    using RenameFunction = std::function<RenameOutcome(const QString& from, const QString& to, QString& error)>;

    explicit MoveExecutor(QStringList companion_extensions);
    ~MoveExecutor();

    MoveResult apply(const MediaItemList& items, ProgressCallback progress_callback = nullptr);

    // Primary sizes plus the sizes of every companion found right now.
    qint64 compute_total_bytes(const MediaItemList& items) const;

    // Files next to video_path with the same stem and a companion extension.
    QStringList list_companion_files(const QString& video_path) const;

    void set_chunk_size(qint64 bytes);
    qint64 chunk_size() const { return chunk_size_; }

    // Tests replace the platform rename to simulate other volumes.
    void set_rename_function(RenameFunction fn);

    static RenameOutcome rename_atomic(const QString& from, const QString& to, QString& error);

private:
    // True when source ended up at dest.
    bool move_path(const QString& source, const QString& dest, const QString& label,
                   MoveResult& result, const ProgressCallback& callback);
    bool copy_with_progress(const QString& source, const QString& dest, const QString& label,
                            MoveResult& result, const ProgressCallback& callback, QString& error);
    void add_bytes(qint64 bytes, const QString& label, MoveResult& result, const ProgressCallback& callback);
    void record_error(MoveResult& result, const QString& path, const QString& message);

    QStringList companion_extensions_;
    qint64 chunk_size_;
    RenameFunction rename_;
};

#endif // MOVE_EXECUTOR_HPP
