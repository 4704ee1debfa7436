#include "CleanupSweep.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <algorithm>

namespace {

QString normalized(const QString& path) {
    QString clean = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
#ifdef Q_OS_WIN
    clean = clean.toLower();
#endif
    return clean;
}

} // namespace

CleanupSweep::CleanupSweep(QStringList video_extensions)
    : video_extensions_(std::move(video_extensions)) {
}

bool CleanupSweep::is_within(const QString& path, const QString& root) {
    const QString p = normalized(path);
    QString r = normalized(root);
    if (p == r) {
        return false;
    }
    if (!r.endsWith('/')) {
        r += '/';
    }
    return p.startsWith(r);
}

bool CleanupSweep::directory_has_videos(const QString& path) const {
    QDirIterator it(path, QDir::Files | QDir::Hidden | QDir::System, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QString suffix = it.fileInfo().suffix().toLower();
        if (!suffix.isEmpty() && video_extensions_.contains("." + suffix)) {
            return true;
        }
    }
    return false;
}

IssueList CleanupSweep::cleanup(const MediaItemList& applied_items, const QStringList& source_roots) const {
    IssueList issues;

    QSet<QString> seen;
    QStringList candidates;
    for (const MediaItem& item : applied_items) {
        const QString dir = normalized(QFileInfo(item.source_path).absolutePath());
        if (!seen.contains(dir)) {
            seen.insert(dir);
            candidates.append(dir);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const QString& a, const QString& b) {
        return a.size() > b.size();
    });

    for (const QString& dir : candidates) {
        const bool inside_root = std::any_of(source_roots.begin(), source_roots.end(),
            [&dir](const QString& root) { return !root.isEmpty() && is_within(dir, root); });
        if (!inside_root) {
            continue;
        }
        if (!QFileInfo(dir).isDir()) {
            continue;
        }
        if (directory_has_videos(dir)) {
            LOG_DEBUG("CleanupSweep", QString("Keeping %1, videos remain").arg(dir));
            continue;
        }

        if (QDir(dir).removeRecursively()) {
            LOG_INFO("CleanupSweep", QString("Removed source folder %1").arg(dir));
        } else {
            issues.push_back({IssueKind::CleanupError, dir, "Could not remove folder"});
            LOG_WARN("CleanupSweep", QString("Could not remove folder %1").arg(dir));
        }
    }

    return issues;
}
