#include "RelocationWorker.hpp"
#include "AppLogger.hpp"
#include "CleanupSweep.hpp"
#include "MediaClassifier.hpp"
#include "MoveExecutor.hpp"
#include "PlanBuilder.hpp"
#include <QFileInfo>
#include <QMetaType>

RelocationWorker::RelocationWorker(const RelocatorConfig& config, QObject* parent)
    : QObject(parent)
    , config_(config) {
    if (config_.ptn_enabled) {
        primary_guesser_ = std::make_shared<PtnGuesser>(config_.python_program, config_.guesser_timeout_ms);
    }
    if (config_.guessit_enabled) {
        secondary_guesser_ = std::make_shared<GuessitGuesser>(config_.guessit_program, config_.guesser_timeout_ms);
    }
}

void RelocationWorker::register_meta_types() {
    qRegisterMetaType<MediaItemList>("MediaItemList");
    qRegisterMetaType<IssueList>("IssueList");
}

void RelocationWorker::check_guessers() {
    QStringList available;
    QStringList missing;

    for (const auto& guesser : {primary_guesser_, secondary_guesser_}) {
        if (!guesser) {
            continue;
        }
        if (guesser->is_available()) {
            available.append(guesser->name());
        } else {
            missing.append(guesser->name());
        }
    }

    LOG_INFO("Worker", QString("Guessers available: [%1], missing: [%2]")
             .arg(available.join(", "), missing.join(", ")));
    emit guessers_checked(available, missing);
}

void RelocationWorker::analyze(const QStringList& source_roots, const QString& destination_root) {
    MediaClassifier classifier(primary_guesser_, secondary_guesser_);
    PlanBuilder builder(config_, classifier);
    PlanResult plan = builder.build_plan(source_roots, destination_root);

    emit analysis_finished(plan.items, plan.warnings);
}

void RelocationWorker::apply(const MediaItemList& items, const QStringList& source_roots) {
    MoveExecutor executor(config_.companion_extensions);
    executor.set_chunk_size(config_.chunk_size);

    MoveResult result = executor.apply(items, [this](qint64 done, qint64 total, const QString& label) {
        emit progress(done, total, label);
    });

    // Only items whose source is gone were relocated; their folders are candidates.
    MediaItemList applied;
    for (const MediaItem& item : items) {
        if (!QFileInfo::exists(item.source_path)) {
            applied.push_back(item);
        }
    }

    CleanupSweep sweep(config_.video_extensions);
    IssueList issues = std::move(result.issues);
    IssueList cleanup_issues = sweep.cleanup(applied, source_roots);
    issues.insert(issues.end(), cleanup_issues.begin(), cleanup_issues.end());

    emit apply_finished(result.files_moved, result.bytes_done, issues);
}
