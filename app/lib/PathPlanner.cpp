#include "PathPlanner.hpp"
#include "NameUtils.hpp"
#include "MediaClassifier.hpp"
#include <QDir>

QString PlannedPath::dest_path() const {
    return QDir::cleanPath(dest_dir + '/' + dest_file_name);
}

PathPlanner::PathPlanner(LibraryLayout layout)
    : layout_(std::move(layout)) {
}

QString PathPlanner::join(const QString& base, const QString& segment) {
    return QDir::cleanPath(base + '/' + naming::sanitize_filename(segment));
}

PlannedPath PathPlanner::plan(const MediaDescriptor& descriptor, const QString& destination_root) const {
    const QString extension = descriptor.extension.isEmpty()
        ? layout_.default_extension
        : descriptor.extension;

    PlannedPath planned;

    if (descriptor.is_series()) {
        QString show = naming::sanitize_filename(descriptor.show_title);
        if (show.isEmpty()) {
            show = MediaClassifier::kUnknownTitle;
        }
        const QString season_folder = QString("%1 %2")
            .arg(layout_.season_prefix)
            .arg(descriptor.season, 2, 10, QChar('0'));

        planned.dest_dir = join(join(join(destination_root, layout_.series_folder), show), season_folder);

        QString base = QString("%1 - %2").arg(show, descriptor.episode_label());
        const QString episode_title = naming::sanitize_filename(descriptor.episode_title);
        if (!episode_title.isEmpty()) {
            base += " - " + episode_title;
        }
        planned.dest_file_name = naming::sanitize_filename(base + extension);
        return planned;
    }

    QString title = naming::sanitize_filename(descriptor.title);
    if (title.isEmpty()) {
        title = MediaClassifier::kUnknownTitle;
    }
    if (descriptor.year) {
        title += QString(" (%1)").arg(*descriptor.year);
    }

    planned.dest_dir = join(destination_root, layout_.movies_folder);
    planned.dest_file_name = naming::sanitize_filename(title + extension);
    return planned;
}

MediaItem PathPlanner::make_item(const QString& source_path,
                                 const MediaDescriptor& descriptor,
                                 const QString& destination_root) const {
    const PlannedPath planned = plan(descriptor, destination_root);

    MediaItem item;
    item.source_path = source_path;
    item.content_type = descriptor.content_type;
    if (descriptor.is_series()) {
        item.show_title = descriptor.show_title;
        item.season = descriptor.season;
        item.episodes = descriptor.episodes;
    }
    item.dest_dir = planned.dest_dir;
    item.dest_file_name = planned.dest_file_name;
    item.dest_path = planned.dest_path();
    return item;
}
