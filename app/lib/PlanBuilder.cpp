#include "PlanBuilder.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFileInfo>
#include <exception>

PlanBuilder::PlanBuilder(const RelocatorConfig& config, MediaClassifier classifier)
    : config_(config)
    , classifier_(std::move(classifier))
    , planner_(config.layout)
    , sample_rx_(config.sample_matcher()) {
}

PlanResult PlanBuilder::build_plan(const QStringList& source_roots, const QString& destination_root) const {
    PlanResult result;

    LOG_INFO("PlanBuilder", QString("Analyzing %1 source folder(s) into %2")
             .arg(source_roots.size()).arg(destination_root));

    for (const QString& root : source_roots) {
        if (root.trimmed().isEmpty() || !QFileInfo(root).isDir()) {
            LOG_WARN("PlanBuilder", QString("Skipping missing source folder: %1").arg(root));
            continue;
        }
        scan_directory(QFileInfo(root).absoluteFilePath(), destination_root, result);
    }

    LOG_INFO("PlanBuilder", QString("Analysis complete: %1 item(s), %2 warning(s)")
             .arg(result.items.size()).arg(result.warnings.size()));
    return result;
}

void PlanBuilder::scan_directory(const QString& path, const QString& destination_root, PlanResult& result) const {
    QDir dir(path);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);

    for (const QFileInfo& entry : entries) {
        const QString name = entry.fileName();
        if (config_.is_hidden_name(name)) {
            continue;
        }

        if (entry.isDir()) {
            // Do not follow directory links, a loop would never end.
            if (!entry.isSymLink()) {
                scan_directory(entry.absoluteFilePath(), destination_root, result);
            }
            continue;
        }

        if (!is_candidate(name)) {
            continue;
        }

        if (auto item = build_item(entry.absoluteFilePath(), destination_root, result.warnings)) {
            result.items.push_back(std::move(*item));
        }
    }
}

bool PlanBuilder::is_candidate(const QString& file_name) const {
    if (config_.is_hidden_name(file_name) || !config_.is_video_file(file_name)) {
        return false;
    }
    if (!config_.sample_pattern.isEmpty() && sample_rx_.match(file_name).hasMatch()) {
        LOG_DEBUG("PlanBuilder", QString("Ignoring sample file: %1").arg(file_name));
        return false;
    }
    return true;
}

std::optional<MediaItem> PlanBuilder::build_item(const QString& source_path,
                                                 const QString& destination_root,
                                                 IssueList& warnings) const {
    auto warn = [&](const QString& message) {
        warnings.push_back({IssueKind::AnalysisWarning, source_path, message});
        LOG_WARN("PlanBuilder", QString("%1: %2").arg(source_path, message));
    };

    const QFileInfo info(source_path);
    if (!info.exists() || !info.isFile()) {
        warn("File disappeared during analysis");
        return std::nullopt;
    }
    if (!info.isReadable()) {
        warn("File is not readable");
        return std::nullopt;
    }

    try {
        const QString parent_name = info.dir().dirName();
        const MediaDescriptor descriptor = classifier_.classify(info.fileName(), parent_name);

        MediaItem item = planner_.make_item(info.absoluteFilePath(), descriptor, destination_root);
        item.source_size = info.size();

        LOG_DEBUG("PlanBuilder", QString("%1 -> %2").arg(item.source_path, item.dest_path));
        return item;
    } catch (const std::exception& ex) {
        warn(QString("Could not classify: %1").arg(ex.what()));
    }
    return std::nullopt;
}
