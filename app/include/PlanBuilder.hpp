#ifndef PLAN_BUILDER_HPP
#define PLAN_BUILDER_HPP

#include "MediaClassifier.hpp"
#include "MediaTypes.hpp"
#include "PathPlanner.hpp"
#include "RelocationIssue.hpp"
#include "RelocatorConfig.hpp"
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <optional>

struct PlanResult {
    MediaItemList items;
    IssueList warnings;  // AnalysisWarning only
};

// Walks the source roots and plans a destination for every video found.
// Never creates, moves or deletes anything.
class PlanBuilder {
public:
    PlanBuilder(const RelocatorConfig& config, MediaClassifier classifier);

    PlanResult build_plan(const QStringList& source_roots, const QString& destination_root) const;

    // Classifies and plans one file; nullopt (and a warning) when it cannot be read.
    std::optional<MediaItem> build_item(const QString& source_path,
                                        const QString& destination_root,
                                        IssueList& warnings) const;

    // Hidden, non-video and sample files are not part of a plan.
    bool is_candidate(const QString& file_name) const;

private:
    void scan_directory(const QString& path, const QString& destination_root, PlanResult& result) const;

    RelocatorConfig config_;
    MediaClassifier classifier_;
    PathPlanner planner_;
    QRegularExpression sample_rx_;
};

#endif // PLAN_BUILDER_HPP
