#include "MoveExecutor.hpp"
#include "AppLogger.hpp"
#include "NameUtils.hpp"
#include "RelocatorConfig.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <cerrno>
#include <cstdio>
#include <cstring>
#endif

MoveExecutor::MoveExecutor(QStringList companion_extensions)
    : companion_extensions_(std::move(companion_extensions))
    , chunk_size_(RelocatorConfig::kDefaultChunkSize)
    , rename_(&MoveExecutor::rename_atomic) {
}

MoveExecutor::~MoveExecutor() = default;

void MoveExecutor::set_chunk_size(qint64 bytes) {
    chunk_size_ = std::max(RelocatorConfig::kMinChunkSize, bytes);
}

void MoveExecutor::set_rename_function(RenameFunction fn) {
    rename_ = fn ? std::move(fn) : RenameFunction(&MoveExecutor::rename_atomic);
}

RenameOutcome MoveExecutor::rename_atomic(const QString& from, const QString& to, QString& error) {
#ifdef Q_OS_WIN
    const std::wstring native_from = QDir::toNativeSeparators(from).toStdWString();
    const std::wstring native_to = QDir::toNativeSeparators(to).toStdWString();
    if (MoveFileExW(native_from.c_str(), native_to.c_str(), MOVEFILE_REPLACE_EXISTING)) {
        return RenameOutcome::Renamed;
    }
    const DWORD code = GetLastError();
    if (code == ERROR_NOT_SAME_DEVICE) {
        return RenameOutcome::CrossDevice;
    }
    error = QString("MoveFileEx failed (error %1)").arg(code);
    return RenameOutcome::Failed;
#else
    if (::rename(QFile::encodeName(from).constData(), QFile::encodeName(to).constData()) == 0) {
        return RenameOutcome::Renamed;
    }
    const int code = errno;
    if (code == EXDEV) {
        return RenameOutcome::CrossDevice;
    }
    error = QString::fromLocal8Bit(std::strerror(code));
    return RenameOutcome::Failed;
#endif
}

QStringList MoveExecutor::list_companion_files(const QString& video_path) const {
    const QFileInfo video(video_path);
    const QString stem = video.completeBaseName();

    QStringList companions;
    const QFileInfoList entries = video.dir().entryInfoList(
        QDir::Files | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& entry : entries) {
        if (entry.absoluteFilePath() == video.absoluteFilePath()) {
            continue;
        }
        if (entry.completeBaseName() != stem || entry.suffix().isEmpty()) {
            continue;
        }
        if (companion_extensions_.contains("." + entry.suffix().toLower())) {
            companions.append(entry.absoluteFilePath());
        }
    }
    return companions;
}

qint64 MoveExecutor::compute_total_bytes(const MediaItemList& items) const {
    qint64 total = 0;
    for (const MediaItem& item : items) {
        total += QFileInfo(item.source_path).size();
        for (const QString& companion : list_companion_files(item.source_path)) {
            total += QFileInfo(companion).size();
        }
    }
    return total;
}

MoveResult MoveExecutor::apply(const MediaItemList& items, ProgressCallback progress_callback) {
    MoveResult result;
    result.bytes_total = compute_total_bytes(items);

    LOG_INFO("MoveExecutor", QString("Moving %1 item(s), %2")
             .arg(items.size()).arg(naming::format_bytes(result.bytes_total)));

    if (progress_callback) {
        progress_callback(0, result.bytes_total, QString());
    }

    for (const MediaItem& item : items) {
        const QFileInfo source_info(item.source_path);
        const QString label = source_info.fileName();

        // Companions are gathered before the primary leaves the folder.
        const QStringList companions = list_companion_files(item.source_path);

        if (!move_path(item.source_path, item.dest_path, label, result, progress_callback)) {
            continue;
        }
        result.files_moved++;

        const QString dest_stem = QFileInfo(item.dest_path).completeBaseName();
        for (const QString& companion : companions) {
            const QFileInfo companion_info(companion);
            const QString new_name = naming::sanitize_filename(dest_stem + "." + companion_info.suffix());
            const QString dest = QDir::cleanPath(item.dest_dir + '/' + new_name);
            if (move_path(companion, dest, companion_info.fileName(), result, progress_callback)) {
                result.companions_moved++;
            }
        }
    }

    result.success = result.errors == 0;
    LOG_INFO("MoveExecutor", QString("Batch finished: %1 file(s), %2 companion(s), %3 error(s)")
             .arg(result.files_moved).arg(result.companions_moved).arg(result.errors));
    return result;
}

bool MoveExecutor::move_path(const QString& source, const QString& dest, const QString& label,
                             MoveResult& result, const ProgressCallback& callback) {
    const QFileInfo source_info(source);

    // Verify source file still exists before attempting move
    if (!source_info.exists()) {
        record_error(result, source, "Source file no longer exists");
        return false;
    }

    if (source_info.absoluteFilePath() == QFileInfo(dest).absoluteFilePath()) {
        LOG_DEBUG("MoveExecutor", QString("Already in place: %1").arg(source));
        add_bytes(source_info.size(), label, result, callback);
        return true;
    }

    const QString dest_dir = QFileInfo(dest).absolutePath();
    if (!QDir().mkpath(dest_dir)) {
        record_error(result, source, QString("Could not create folder %1").arg(dest_dir));
        return false;
    }

    // Overwrite semantics; a file that cannot be removed is left for the rename to report.
    if (QFileInfo::exists(dest) && !QFile::remove(dest)) {
        LOG_WARN("MoveExecutor", QString("Could not remove existing %1").arg(dest));
    }

    const qint64 size = source_info.size();
    QString error;
    switch (rename_(source, dest, error)) {
        case RenameOutcome::Renamed:
            LOG_DEBUG("MoveExecutor", QString("Renamed %1 -> %2").arg(source, dest));
            add_bytes(size, label, result, callback);
            return true;

        case RenameOutcome::CrossDevice:
            LOG_DEBUG("MoveExecutor", QString("Different volume, copying %1 -> %2").arg(source, dest));
            if (!copy_with_progress(source, dest, label, result, callback, error)) {
                record_error(result, source, QString("Copy to %1 failed: %2").arg(dest, error));
                return false;
            }
            if (!QFile::remove(source)) {
                LOG_WARN("MoveExecutor", QString("Copied but could not remove source: %1").arg(source));
            }
            return true;

        case RenameOutcome::Failed:
            break;
    }

    record_error(result, source, QString("Could not move to %1: %2").arg(dest, error));
    return false;
}

bool MoveExecutor::copy_with_progress(const QString& source, const QString& dest, const QString& label,
                                      MoveResult& result, const ProgressCallback& callback, QString& error) {
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        error = in.errorString();
        return false;
    }

    QFile out(dest);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = out.errorString();
        return false;
    }

    bool ok = true;
    while (!in.atEnd()) {
        const QByteArray chunk = in.read(chunk_size_);
        if (chunk.isEmpty()) {
            if (in.error() != QFileDevice::NoError) {
                error = in.errorString();
                ok = false;
            }
            break;
        }
        if (out.write(chunk) != chunk.size()) {
            error = out.errorString();
            ok = false;
            break;
        }
        add_bytes(chunk.size(), label, result, callback);
    }

    // Small writes sit in the device buffer until flush, so its failure is a copy failure.
    if (ok && !out.flush()) {
        error = out.errorString();
        ok = false;
    }

    if (ok) {
        // Metadata is best effort, not every filesystem keeps it.
        const QFileInfo source_info(source);
        if (!out.setFileTime(source_info.lastModified(), QFileDevice::FileModificationTime)
            || !out.setFileTime(source_info.lastRead(), QFileDevice::FileAccessTime)) {
            LOG_DEBUG("MoveExecutor", QString("Could not copy timestamps to %1").arg(dest));
        }
    }

    out.close();
    if (ok && out.error() != QFileDevice::NoError) {
        error = out.errorString();
        ok = false;
    }
    in.close();

    if (ok && QFileInfo(dest).size() != QFileInfo(source).size()) {
        error = QString("Destination size %1 does not match source size %2")
            .arg(QFileInfo(dest).size()).arg(QFileInfo(source).size());
        ok = false;
    }

    if (!ok) {
        if (!QFile::remove(dest)) {
            LOG_WARN("MoveExecutor", QString("Could not remove partial copy %1").arg(dest));
        }
        return false;
    }

    if (!QFile::setPermissions(dest, QFile::permissions(source))) {
        LOG_DEBUG("MoveExecutor", QString("Could not copy permissions to %1").arg(dest));
    }
    return true;
}

void MoveExecutor::add_bytes(qint64 bytes, const QString& label, MoveResult& result,
                             const ProgressCallback& callback) {
    result.bytes_done += bytes;
    if (callback) {
        callback(result.bytes_done, result.bytes_total, label);
    }
}

void MoveExecutor::record_error(MoveResult& result, const QString& path, const QString& message) {
    result.errors++;
    result.issues.push_back({IssueKind::MoveError, path, message});
    LOG_ERROR("MoveExecutor", QString("%1: %2").arg(path, message));
}
