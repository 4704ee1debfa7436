#ifndef PATH_PLANNER_HPP
#define PATH_PLANNER_HPP

#include "MediaTypes.hpp"
#include <QString>

struct PlannedPath {
    QString dest_dir;
    QString dest_file_name;

    QString dest_path() const;
};

// Folder names used under the destination root.
struct LibraryLayout {
    QString movies_folder = "Movies";
    QString series_folder = "Series";
    QString season_prefix = "Season";
    QString default_extension = ".mkv";
};

// Pure mapping from descriptor to destination, no filesystem access:
//   <root>/Movies/<Title>[ (<Year>)].<ext>
//   <root>/Series/<Show>/Season SS/<Show> - SSxEE[ - <Episode title>].<ext>
class PathPlanner {
public:
    explicit PathPlanner(LibraryLayout layout = LibraryLayout());

    PlannedPath plan(const MediaDescriptor& descriptor, const QString& destination_root) const;

    // Planned item for source_path, with every destination field filled in.
    MediaItem make_item(const QString& source_path,
                        const MediaDescriptor& descriptor,
                        const QString& destination_root) const;

    const LibraryLayout& layout() const { return layout_; }

private:
    static QString join(const QString& base, const QString& segment);

    LibraryLayout layout_;
};

#endif // PATH_PLANNER_HPP
