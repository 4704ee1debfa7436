#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include "PathPlanner.hpp"

static MediaDescriptor movie(const QString& title, std::optional<int> year, const QString& ext) {
    MediaDescriptor d;
    d.content_type = ContentType::Movie;
    d.title = title;
    d.year = year;
    d.extension = ext;
    return d;
}

static MediaDescriptor episode(const QString& show, int season, std::vector<int> episodes,
                               const QString& episode_title, const QString& ext) {
    MediaDescriptor d;
    d.content_type = ContentType::Series;
    d.show_title = show;
    d.season = season;
    d.episodes = std::move(episodes);
    d.episode_title = episode_title;
    d.extension = ext;
    return d;
}

static void test_movies() {
    std::cout << "[Test] Movie destinations..." << std::endl;
    PathPlanner planner;

    PlannedPath p = planner.plan(movie("Blade Runner", 1982, ".mkv"), "/lib");
    assert(p.dest_dir == "/lib/Movies");
    assert(p.dest_file_name == "Blade Runner (1982).mkv");
    assert(p.dest_path() == "/lib/Movies/Blade Runner (1982).mkv");

    p = planner.plan(movie("Alien", std::nullopt, ""), "/lib/");
    assert(p.dest_path() == "/lib/Movies/Alien.mkv");

    p = planner.plan(movie("", std::nullopt, ".mp4"), "/lib");
    assert(p.dest_file_name == "Unknown.mp4");
    std::cout << "[PASS] Movie destinations" << std::endl;
}

static void test_series() {
    std::cout << "[Test] Series destinations..." << std::endl;
    PathPlanner planner;

    PlannedPath p = planner.plan(episode("Cheers", 4, {5}, "Tortilla", ".mkv"), "/lib");
    assert(p.dest_dir == "/lib/Series/Cheers/Season 04");
    assert(p.dest_file_name == "Cheers - 04x05 - Tortilla.mkv");

    p = planner.plan(episode("Lost", 1, {1, 2}, "", ".avi"), "/lib");
    assert(p.dest_path() == "/lib/Series/Lost/Season 01/Lost - 01x01-02.avi");

    // Every segment is sanitized on its own.
    p = planner.plan(episode("Star Trek: TNG", 3, {15}, "Yesterday's Enterprise?", ".mkv"), "/lib");
    assert(p.dest_dir == "/lib/Series/Star Trek_ TNG/Season 03");
    assert(p.dest_file_name == "Star Trek_ TNG - 03x15 - Yesterday's Enterprise_.mkv");
    assert(!p.dest_file_name.contains('/'));
    std::cout << "[PASS] Series destinations" << std::endl;
}

static void test_custom_layout() {
    std::cout << "[Test] Custom library layout..." << std::endl;
    LibraryLayout layout;
    layout.movies_folder = "Peliculas";
    layout.series_folder = "TV";
    layout.season_prefix = "Temporada";
    layout.default_extension = ".mp4";
    PathPlanner planner(layout);

    assert(planner.plan(episode("Cheers", 1, {2}, "", ""), "/lib").dest_path()
           == "/lib/TV/Cheers/Temporada 01/Cheers - 01x02.mp4");
    assert(planner.plan(movie("Alien", 1979, ".mkv"), "/lib").dest_path()
           == "/lib/Peliculas/Alien (1979).mkv");
    std::cout << "[PASS] Custom library layout" << std::endl;
}

static void test_make_item() {
    std::cout << "[Test] Planned item fields..." << std::endl;
    PathPlanner planner;

    MediaItem item = planner.make_item("/src/Cheers_04x05.mkv", episode("Cheers", 4, {5}, "", ".mkv"), "/lib");
    assert(item.source_path == "/src/Cheers_04x05.mkv");
    assert(item.content_type == ContentType::Series);
    assert(item.show_title == "Cheers");
    assert(item.season && *item.season == 4);
    assert(item.episodes == std::vector<int>{5});
    assert(item.dest_path == item.dest_dir + "/" + item.dest_file_name);

    MediaItem film = planner.make_item("/src/alien.mkv", movie("Alien", 1979, ".mkv"), "/lib");
    assert(film.content_type == ContentType::Movie);
    assert(film.show_title.isEmpty());
    assert(!film.season);
    assert(film.episodes.empty());
    std::cout << "[PASS] Planned item fields" << std::endl;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_movies();
    test_series();
    test_custom_layout();
    test_make_item();

    std::cout << "[Test] PathPlanner: all passed" << std::endl;
    return 0;
}
