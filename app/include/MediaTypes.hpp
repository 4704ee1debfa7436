#ifndef MEDIA_TYPES_HPP
#define MEDIA_TYPES_HPP

#include <QString>
#include <QMetaType>
#include <optional>
#include <vector>

enum class ContentType {
    Movie,
    Series
};

// Which step of the classification chain produced a descriptor.
enum class ClassificationRule {
    NumberedFranchise,
    SeriesLeadingTitle,
    SeriesPatternAnywhere,
    PrimaryGuesser,
    SecondaryGuesser,
    FallbackMovie
};

struct MediaDescriptor {
    ContentType content_type = ContentType::Movie;
    ClassificationRule rule = ClassificationRule::FallbackMovie;

    // Movie fields. For the franchise form title is already "<Franchise> NN - <Title>".
    QString title;
    std::optional<int> year;

    // Series fields
    QString show_title;
    int season = 1;
    std::vector<int> episodes;
    QString episode_title;

    QString extension;  // ".mkv"; empty when the source has none

    bool is_series() const { return content_type == ContentType::Series; }
    QString episode_label() const;

    bool operator==(const MediaDescriptor& other) const;
    bool operator!=(const MediaDescriptor& other) const { return !(*this == other); }
};

// One file to relocate. Destination fields are filled once by the planner.
struct MediaItem {
    QString source_path;
    ContentType content_type = ContentType::Movie;
    QString show_title;          // Series only
    std::optional<int> season;   // Series only
    std::vector<int> episodes;   // Series only
    QString dest_file_name;
    QString dest_dir;
    QString dest_path;
    qint64 source_size = 0;
};

using MediaItemList = std::vector<MediaItem>;

QString content_type_name(ContentType type);
QString classification_rule_name(ClassificationRule rule);

Q_DECLARE_METATYPE(MediaItemList)

#endif // MEDIA_TYPES_HPP
