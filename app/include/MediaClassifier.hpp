#ifndef MEDIA_CLASSIFIER_HPP
#define MEDIA_CLASSIFIER_HPP

#include "MediaTypes.hpp"
#include "TitleGuesser.hpp"
#include <QString>
#include <QRegularExpressionMatch>
#include <memory>
#include <optional>

// Turns a release file name into a movie or episode descriptor.
//
// Rules are tried in order and the first match wins:
//   1. "<Franchise> NN - <Title>"           -> movie
//   2. "<Show> S01E02 ..." / "<Show> 1x02"  -> episode, title anchored at start
//   3. S01E02 / 1x02 token anywhere         -> episode, show from prefix or parent folder
//   4. primary guesser reports season/episode
//   5. secondary guesser reports episode or movie
//   6. cleaned stem as movie title
//
// classify() never fails and is deterministic for a given pair of inputs
// (as long as the injected guessers are).
class MediaClassifier {
public:
    explicit MediaClassifier(std::shared_ptr<TitleGuesser> primary_guesser = nullptr,
                             std::shared_ptr<TitleGuesser> secondary_guesser = nullptr);

    MediaDescriptor classify(const QString& file_name, const QString& parent_dir_name) const;

    // Show title derived from a folder like "Cheers - Temporada 4 [DVDRip]".
    // Empty when nothing usable remains.
    static QString show_from_parent_dir(const QString& parent_dir_name);

    bool has_primary_guesser() const;
    bool has_secondary_guesser() const;

    static const QString kUnknownTitle;

private:
    std::optional<MediaDescriptor> match_numbered_franchise(const QString& stem) const;
    std::optional<MediaDescriptor> match_series_leading_title(const QString& stem,
                                                              const QString& parent_dir_name) const;
    std::optional<MediaDescriptor> match_series_anywhere(const QString& stem,
                                                         const QString& parent_dir_name) const;
    std::optional<MediaDescriptor> match_guess(const TitleGuesser& guesser,
                                               ClassificationRule rule,
                                               const QString& file_name,
                                               const QString& stem,
                                               const QString& parent_dir_name) const;

    MediaDescriptor series_from_guess(const GuessResult& guess,
                                      ClassificationRule rule,
                                      const QString& stem,
                                      const QString& parent_dir_name) const;

    static QString resolve_show_title(const QString& raw_title, const QString& parent_dir_name);
    static QRegularExpressionMatch find_episode_token(const QString& stem);

    std::shared_ptr<TitleGuesser> primary_guesser_;
    std::shared_ptr<TitleGuesser> secondary_guesser_;
};

#endif // MEDIA_CLASSIFIER_HPP
