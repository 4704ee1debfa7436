#include "MediaTypes.hpp"
#include "NameUtils.hpp"

QString MediaDescriptor::episode_label() const {
    return naming::episode_label(season, episodes);
}

bool MediaDescriptor::operator==(const MediaDescriptor& other) const {
    return content_type == other.content_type
        && rule == other.rule
        && title == other.title
        && year == other.year
        && show_title == other.show_title
        && season == other.season
        && episodes == other.episodes
        && episode_title == other.episode_title
        && extension == other.extension;
}

QString content_type_name(ContentType type) {
    return type == ContentType::Series ? "series" : "movie";
}

QString classification_rule_name(ClassificationRule rule) {
    switch (rule) {
        case ClassificationRule::NumberedFranchise:     return "numbered-franchise";
        case ClassificationRule::SeriesLeadingTitle:    return "series-leading-title";
        case ClassificationRule::SeriesPatternAnywhere: return "series-pattern";
        case ClassificationRule::PrimaryGuesser:        return "primary-guesser";
        case ClassificationRule::SecondaryGuesser:      return "secondary-guesser";
        case ClassificationRule::FallbackMovie:         return "fallback-movie";
    }
    return "unknown";
}
