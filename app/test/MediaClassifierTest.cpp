#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include <QJsonDocument>
#include "MediaClassifier.hpp"
#include "PathPlanner.hpp"

// Guesser with a canned answer, standing in for PTN or guessit.
class StubGuesser : public TitleGuesser {
public:
    StubGuesser(bool available, std::optional<GuessResult> answer)
        : available_(available), answer_(std::move(answer)) {}

    QString name() const override { return "stub"; }
    bool is_available() const override { return available_; }
    std::optional<GuessResult> guess(const QString&) const override {
        ++calls;
        return answer_;
    }

    mutable int calls = 0;

private:
    bool available_;
    std::optional<GuessResult> answer_;
};

static QString planned_relative(const MediaDescriptor& d) {
    PathPlanner planner;
    return planner.plan(d, "/lib").dest_path().mid(QString("/lib/").size());
}

static void test_leading_series() {
    std::cout << "[Test] Series with leading title..." << std::endl;
    MediaClassifier classifier;

    MediaDescriptor d = classifier.classify("Cheers_04x05-Tortilla.mkv", "Downloads");
    assert(d.is_series());
    assert(d.rule == ClassificationRule::SeriesLeadingTitle);
    assert(d.show_title == "Cheers");
    assert(d.season == 4);
    assert(d.episodes == std::vector<int>{5});
    assert(d.episode_title == "Tortilla");
    assert(d.extension == ".mkv");
    assert(planned_relative(d) == "Series/Cheers/Season 04/Cheers - 04x05 - Tortilla.mkv");

    d = classifier.classify("Breaking.Bad.S02E03.720p.HDTV.x264.mkv", "");
    assert(d.is_series());
    assert(d.show_title == "Breaking Bad");
    assert(d.season == 2);
    assert(d.episodes == std::vector<int>{3});
    std::cout << "[PASS] Series with leading title" << std::endl;
}

static void test_numbered_franchise() {
    std::cout << "[Test] Numbered franchise movie..." << std::endl;
    MediaClassifier classifier;

    MediaDescriptor d = classifier.classify("Shin Chan 01 - La Pelicula.mkv", "Movies");
    assert(!d.is_series());
    assert(d.rule == ClassificationRule::NumberedFranchise);
    assert(d.title == "Shin Chan 01 - La Pelicula");
    assert(!d.year);
    assert(planned_relative(d) == "Movies/Shin Chan 01 - La Pelicula.mkv");

    d = classifier.classify("Saw 3 - The Trap [1080p].avi", "");
    assert(d.title == "Saw 03 - The Trap");
    assert(d.extension == ".avi");
    std::cout << "[PASS] Numbered franchise movie" << std::endl;
}

static void test_fallback_movie() {
    std::cout << "[Test] Fallback movie..." << std::endl;
    MediaClassifier classifier;

    MediaDescriptor d = classifier.classify("random.release.720p.mkv", "stuff");
    assert(!d.is_series());
    assert(d.rule == ClassificationRule::FallbackMovie);
    assert(d.title == "random release 720p");
    assert(planned_relative(d) == "Movies/random release 720p.mkv");

    d = classifier.classify("CON.mkv", "");
    assert(d.title == "_CON");
    assert(planned_relative(d) == "Movies/_CON.mkv");
    std::cout << "[PASS] Fallback movie" << std::endl;
}

static void test_show_from_parent() {
    std::cout << "[Test] Show title from parent folder..." << std::endl;
    MediaClassifier classifier;

    MediaDescriptor d = classifier.classify("S01E02.mkv", "Cheers - Temporada 4 [DVDRip]");
    assert(d.is_series());
    assert(d.rule == ClassificationRule::SeriesPatternAnywhere);
    assert(d.show_title == "Cheers");
    assert(d.season == 1);
    assert(d.episodes == std::vector<int>{2});

    assert(MediaClassifier::show_from_parent_dir("The Office Completa HDTV") == "The Office");
    assert(MediaClassifier::show_from_parent_dir("").isEmpty());

    d = classifier.classify("1x03.mkv", "");
    assert(d.is_series());
    assert(d.show_title == MediaClassifier::kUnknownTitle);
    std::cout << "[PASS] Show title from parent folder" << std::endl;
}

static void test_determinism() {
    std::cout << "[Test] Classification is deterministic..." << std::endl;
    MediaClassifier classifier;
    const QStringList names = {
        "Cheers_04x05-Tortilla.mkv", "Shin Chan 01 - La Pelicula.mkv",
        "random.release.720p.mkv", "Lost.S01E01-E02.Pilot.mp4", "[Group] Anime - 12 [720p].mkv"
    };
    for (const QString& name : names) {
        assert(classifier.classify(name, "Parent") == classifier.classify(name, "Parent"));
    }
    std::cout << "[PASS] Classification is deterministic" << std::endl;
}

static void test_primary_guesser() {
    std::cout << "[Test] Primary guesser..." << std::endl;

    GuessResult answer;
    answer.title = "Show Name";
    answer.season = 2;
    answer.episodes = {3, 4};
    auto primary = std::make_shared<StubGuesser>(true, answer);

    MediaClassifier classifier(primary);
    MediaDescriptor d = classifier.classify("Show.Name.Special.mkv", "");
    assert(d.rule == ClassificationRule::PrimaryGuesser);
    assert(d.show_title == "Show Name");
    assert(d.season == 2);
    assert((d.episodes == std::vector<int>{3, 4}));
    assert(d.episode_label() == "02x03-04");
    assert(planned_relative(d) == "Series/Show Name/Season 02/Show Name - 02x03-04.mkv");

    // Local rules win before any guesser is asked.
    const int calls_before = primary->calls;
    classifier.classify("Cheers_04x05-Tortilla.mkv", "");
    assert(primary->calls == calls_before);

    // A guess without season or episode is no opinion.
    auto movie_only = std::make_shared<StubGuesser>(true, GuessResult{});
    MediaClassifier no_opinion(movie_only);
    assert(no_opinion.classify("plain.title.mkv", "").rule == ClassificationRule::FallbackMovie);
    std::cout << "[PASS] Primary guesser" << std::endl;
}

static void test_secondary_guesser() {
    std::cout << "[Test] Secondary guesser..." << std::endl;

    GuessResult movie;
    movie.kind = GuessKind::Movie;
    movie.title = "Blade Runner";
    movie.year = 1982;
    MediaClassifier classifier(nullptr, std::make_shared<StubGuesser>(true, movie));

    MediaDescriptor d = classifier.classify("blade.runner.final.cut.mkv", "");
    assert(d.rule == ClassificationRule::SecondaryGuesser);
    assert(!d.is_series());
    assert(d.title == "Blade Runner");
    assert(d.year && *d.year == 1982);
    assert(planned_relative(d) == "Movies/Blade Runner (1982).mkv");

    const QJsonObject json = QJsonDocument::fromJson(
        R"({"type":"episode","title":"Cheers","season":"4","episode":[5,6],"episode_title":"Tortilla"})").object();
    MediaClassifier episode_classifier(nullptr, std::make_shared<StubGuesser>(true, guess_from_json(json)));
    d = episode_classifier.classify("cheers.special.mkv", "");
    assert(d.rule == ClassificationRule::SecondaryGuesser);
    assert(d.show_title == "Cheers");
    assert(d.season == 4);
    assert(d.episode_label() == "04x05-06");
    assert(d.episode_title == "Tortilla");
    std::cout << "[PASS] Secondary guesser" << std::endl;
}

static void test_unavailable_guessers() {
    std::cout << "[Test] Unavailable guessers are skipped..." << std::endl;

    GuessResult answer;
    answer.season = 1;
    answer.episodes = {1};
    auto primary = std::make_shared<StubGuesser>(false, answer);
    auto secondary = std::make_shared<StubGuesser>(false, answer);

    MediaClassifier classifier(primary, secondary);
    assert(!classifier.has_primary_guesser());
    assert(!classifier.has_secondary_guesser());

    MediaDescriptor d = classifier.classify("random.release.720p.mkv", "");
    assert(d.rule == ClassificationRule::FallbackMovie);
    assert(primary->calls == 0);
    assert(secondary->calls == 0);
    std::cout << "[PASS] Unavailable guessers are skipped" << std::endl;
}

static void test_guess_from_json() {
    std::cout << "[Test] Guesser JSON normalization..." << std::endl;

    GuessResult ptn = guess_from_json(QJsonDocument::fromJson(
        R"({"title":"Cheers","season":4,"episode":5,"container":"mkv"})").object());
    assert(ptn.kind == GuessKind::Unknown);
    assert(ptn.title == "Cheers");
    assert(ptn.season && *ptn.season == 4);
    assert(ptn.episodes == std::vector<int>{5});
    assert(ptn.container == "mkv");
    assert(ptn.has_episode_info());

    GuessResult movie = guess_from_json(QJsonDocument::fromJson(
        R"({"type":"movie","title":"Alien","year":"1979"})").object());
    assert(movie.kind == GuessKind::Movie);
    assert(movie.year && *movie.year == 1979);
    assert(!movie.has_episode_info());

    GuessResult huge = guess_from_json(QJsonDocument::fromJson(
        R"({"title":"Overflow","season":1e12,"episode":-5e10,"year":2147483648})").object());
    assert(!huge.season);
    assert(huge.episodes.empty());
    assert(!huge.year);
    assert(huge.title == "Overflow");
    std::cout << "[PASS] Guesser JSON normalization" << std::endl;
}

static void test_missing_programs_fail_closed() {
    std::cout << "[Test] Missing guesser programs fail closed..." << std::endl;
    auto ptn = std::make_shared<PtnGuesser>("/nonexistent/python3", 500);
    auto guessit = std::make_shared<GuessitGuesser>("guessit-not-installed-here", 500);
    assert(!ptn->is_available());
    assert(!guessit->is_available());
    assert(!guessit->guess("Cheers.S01E01.mkv"));

    MediaClassifier classifier(ptn, guessit);
    assert(classifier.classify("plain.title.mkv", "").rule == ClassificationRule::FallbackMovie);
    std::cout << "[PASS] Missing guesser programs fail closed" << std::endl;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_leading_series();
    test_numbered_franchise();
    test_fallback_movie();
    test_show_from_parent();
    test_determinism();
    test_primary_guesser();
    test_secondary_guesser();
    test_unavailable_guessers();
    test_guess_from_json();
    test_missing_programs_fail_closed();

    std::cout << "[Test] MediaClassifier: all passed" << std::endl;
    return 0;
}
