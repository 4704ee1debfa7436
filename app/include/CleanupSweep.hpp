#ifndef CLEANUP_SWEEP_HPP
#define CLEANUP_SWEEP_HPP

#include "MediaTypes.hpp"
#include "RelocationIssue.hpp"
#include <QString>
#include <QStringList>

// Removes source folders that no longer hold any video after a batch.
// Only folders strictly inside a source root are considered.
class CleanupSweep {
public:
    explicit CleanupSweep(QStringList video_extensions);

    // Deepest folder first. Returns one CleanupError per folder that could not be removed.
    IssueList cleanup(const MediaItemList& applied_items, const QStringList& source_roots) const;

    // Any file below path with a video extension, sample or not.
    bool directory_has_videos(const QString& path) const;

    // True when path is below root (path == root is not within).
    static bool is_within(const QString& path, const QString& root);

private:
    QStringList video_extensions_;
};

#endif // CLEANUP_SWEEP_HPP
