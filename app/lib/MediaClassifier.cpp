#include "MediaClassifier.hpp"
#include "NameUtils.hpp"
#include "AppLogger.hpp"
#include <QRegularExpression>
#include <algorithm>

namespace {

const QRegularExpression kNumberedFranchise(
    R"(^\s*(?<franchise>.+?)\s+(?<num>\d{1,3})\s*[\-\x{2013}\x{2014}]\s*(?<title>[^\[\(]+?)\s*(?:\[[^\]]*\]|\([^\)]*\))*\s*$)",
    QRegularExpression::CaseInsensitiveOption);

// Title followed by the season/episode token, anchored at the start.
const QRegularExpression kLeadingSxE(
    R"(^\s*(?<title>.+?)[\s._\-]*S(?<s>\d{1,2})E(?<e>\d{1,3})\b)",
    QRegularExpression::CaseInsensitiveOption);
const QRegularExpression kLeadingNxM(
    R"(^\s*(?<title>.+?)[\s._\-]*(?<s>\d{1,2})x(?<e>\d{1,3})\b)",
    QRegularExpression::CaseInsensitiveOption);

// Standalone tokens: not glued to letters or digits, so "720p" never qualifies.
const QRegularExpression kTokenSxE(
    R"((?:^|[^A-Za-z0-9])S(?<s>\d{1,2})E(?<e>\d{1,3})(?:[^A-Za-z0-9]|$))",
    QRegularExpression::CaseInsensitiveOption);
const QRegularExpression kTokenNxM(
    R"((?:^|[^A-Za-z0-9])(?<s>\d{1,2})x(?<e>\d{1,3})(?:[^A-Za-z0-9]|$))",
    QRegularExpression::CaseInsensitiveOption);

const QRegularExpression kSeasonWord(R"(\bTemporada\b)", QRegularExpression::CaseInsensitiveOption);
const QRegularExpression kParentSeasonClause(
    R"(^(?<title>.+?)\s*-\s*Temporada\b)", QRegularExpression::CaseInsensitiveOption);
const QRegularExpression kParentJunk(
    R"(\b(Temporada|Completa|DVDRip|HDTV|WEB[- ]?DL|BluRay)\b.*$)",
    QRegularExpression::CaseInsensitiveOption);
const QRegularExpression kTrailingSeparators(R"([\s._\-]+$)");

QRegularExpressionMatch match_leading_series(const QString& text) {
    QRegularExpressionMatch m = kLeadingSxE.match(text);
    if (m.hasMatch()) {
        return m;
    }
    return kLeadingNxM.match(text);
}

MediaDescriptor make_series(ClassificationRule rule, const QString& show, int season,
                            std::vector<int> episodes, const QString& episode_title) {
    MediaDescriptor d;
    d.content_type = ContentType::Series;
    d.rule = rule;
    d.show_title = show;
    d.season = season;
    d.episodes = std::move(episodes);
    d.episode_title = episode_title;
    return d;
}

MediaDescriptor make_movie(ClassificationRule rule, const QString& title, std::optional<int> year = std::nullopt) {
    MediaDescriptor d;
    d.content_type = ContentType::Movie;
    d.rule = rule;
    d.title = title;
    d.year = year;
    return d;
}

} // namespace

const QString MediaClassifier::kUnknownTitle = QStringLiteral("Unknown");

MediaClassifier::MediaClassifier(std::shared_ptr<TitleGuesser> primary_guesser,
                                 std::shared_ptr<TitleGuesser> secondary_guesser)
    : primary_guesser_(std::move(primary_guesser))
    , secondary_guesser_(std::move(secondary_guesser)) {
}

bool MediaClassifier::has_primary_guesser() const {
    return primary_guesser_ && primary_guesser_->is_available();
}

bool MediaClassifier::has_secondary_guesser() const {
    return secondary_guesser_ && secondary_guesser_->is_available();
}

MediaDescriptor MediaClassifier::classify(const QString& file_name, const QString& parent_dir_name) const {
    const int dot = file_name.lastIndexOf('.');
    const QString raw_stem = dot > 0 ? file_name.left(dot) : file_name;
    const QString extension = dot > 0 ? file_name.mid(dot) : QString();
    const QString stem = naming::clean_stem(raw_stem);

    std::optional<MediaDescriptor> result = match_numbered_franchise(stem);
    if (!result) {
        result = match_series_leading_title(stem, parent_dir_name);
    }
    if (!result) {
        result = match_series_anywhere(stem, parent_dir_name);
    }
    if (!result && has_primary_guesser()) {
        result = match_guess(*primary_guesser_, ClassificationRule::PrimaryGuesser,
                             file_name, stem, parent_dir_name);
    }
    if (!result && has_secondary_guesser()) {
        result = match_guess(*secondary_guesser_, ClassificationRule::SecondaryGuesser,
                             file_name, stem, parent_dir_name);
    }
    if (!result) {
        QString title = naming::sanitize_filename(naming::beautify_spaces(stem));
        result = make_movie(ClassificationRule::FallbackMovie, title.isEmpty() ? kUnknownTitle : title);
    }

    result->extension = extension;
    LOG_TRACE("Classifier", QString("%1 -> %2 (%3)")
              .arg(file_name, content_type_name(result->content_type),
                   classification_rule_name(result->rule)));
    return *result;
}

std::optional<MediaDescriptor> MediaClassifier::match_numbered_franchise(const QString& stem) const {
    const QRegularExpressionMatch m = kNumberedFranchise.match(stem);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    const QString franchise = naming::beautify_spaces(m.captured("franchise"));
    const int number = naming::positive_int(m.captured("num"));
    const QString title = naming::beautify_spaces(m.captured("title"));

    return make_movie(ClassificationRule::NumberedFranchise,
                      naming::sanitize_filename(QString("%1 %2 - %3")
                          .arg(franchise)
                          .arg(number, 2, 10, QChar('0'))
                          .arg(title)));
}

std::optional<MediaDescriptor> MediaClassifier::match_series_leading_title(const QString& stem,
                                                                           const QString& parent_dir_name) const {
    const QRegularExpressionMatch m = match_leading_series(stem);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    const QString raw_title = m.captured("title").split(kSeasonWord).value(0);
    return make_series(ClassificationRule::SeriesLeadingTitle,
                       resolve_show_title(raw_title, parent_dir_name),
                       naming::positive_int(m.captured("s")),
                       {naming::positive_int(m.captured("e"))},
                       naming::clean_episode_title(stem.mid(m.capturedEnd())));
}

std::optional<MediaDescriptor> MediaClassifier::match_series_anywhere(const QString& stem,
                                                                      const QString& parent_dir_name) const {
    const QRegularExpressionMatch m = find_episode_token(stem);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    QString prefix = stem.left(m.capturedStart());
    prefix.remove(kTrailingSeparators);

    return make_series(ClassificationRule::SeriesPatternAnywhere,
                       resolve_show_title(prefix, parent_dir_name),
                       naming::positive_int(m.captured("s")),
                       {naming::positive_int(m.captured("e"))},
                       naming::clean_episode_title(stem.mid(m.capturedEnd())));
}

std::optional<MediaDescriptor> MediaClassifier::match_guess(const TitleGuesser& guesser,
                                                            ClassificationRule rule,
                                                            const QString& file_name,
                                                            const QString& stem,
                                                            const QString& parent_dir_name) const {
    const std::optional<GuessResult> guess = guesser.guess(file_name);
    if (!guess) {
        return std::nullopt;
    }

    // The primary guesser has no notion of kind; season/episode fields decide.
    if (rule == ClassificationRule::PrimaryGuesser) {
        if (!guess->has_episode_info()) {
            return std::nullopt;
        }
        return series_from_guess(*guess, rule, stem, parent_dir_name);
    }

    if (guess->kind == GuessKind::Episode) {
        return series_from_guess(*guess, rule, stem, parent_dir_name);
    }
    if (guess->kind == GuessKind::Movie) {
        QString title = guess->title.trimmed().isEmpty() ? stem : guess->title;
        title = naming::sanitize_filename(naming::beautify_spaces(title));
        std::optional<int> year;
        if (guess->year && *guess->year > 0) {
            year = guess->year;
        }
        return make_movie(rule, title.isEmpty() ? kUnknownTitle : title, year);
    }
    return std::nullopt;
}

MediaDescriptor MediaClassifier::series_from_guess(const GuessResult& guess,
                                                   ClassificationRule rule,
                                                   const QString& stem,
                                                   const QString& parent_dir_name) const {
    QString raw_title = guess.title.trimmed().isEmpty() ? stem : guess.title;
    const QRegularExpressionMatch leading = match_leading_series(raw_title);
    if (leading.hasMatch()) {
        raw_title = leading.captured("title");
    }

    const int season = (guess.season && *guess.season > 0) ? *guess.season : 1;

    std::vector<int> episodes;
    for (int e : guess.episodes) {
        episodes.push_back(e > 0 ? e : 1);
    }
    if (episodes.empty()) {
        episodes.push_back(1);
    }

    QString episode_title = naming::clean_episode_title(guess.episode_title);
    if (episode_title.isEmpty()) {
        const QRegularExpressionMatch token = find_episode_token(stem);
        if (token.hasMatch()) {
            episode_title = naming::clean_episode_title(stem.mid(token.capturedEnd()));
        }
    }

    return make_series(rule, resolve_show_title(raw_title, parent_dir_name),
                       season, std::move(episodes), episode_title);
}

QString MediaClassifier::resolve_show_title(const QString& raw_title, const QString& parent_dir_name) {
    QString show = naming::sanitize_filename(naming::beautify_spaces(raw_title));
    if (show.isEmpty()) {
        show = show_from_parent_dir(parent_dir_name);
    }
    return show.isEmpty() ? kUnknownTitle : show;
}

QRegularExpressionMatch MediaClassifier::find_episode_token(const QString& stem) {
    QRegularExpressionMatch m = kTokenSxE.match(stem);
    if (m.hasMatch()) {
        return m;
    }
    return kTokenNxM.match(stem);
}

QString MediaClassifier::show_from_parent_dir(const QString& parent_dir_name) {
    QString parent = naming::beautify_spaces(naming::strip_release_tags(parent_dir_name));

    const QRegularExpressionMatch m = kParentSeasonClause.match(parent);
    if (m.hasMatch()) {
        return naming::sanitize_filename(naming::beautify_spaces(m.captured("title")));
    }

    parent.remove(kParentJunk);
    parent = naming::trim_chars(parent, " -");
    return parent.isEmpty() ? QString() : naming::sanitize_filename(parent);
}
