#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "CleanupSweep.hpp"
#include "RelocatorConfig.hpp"

static void write_file(const QString& path) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    bool opened = f.open(QIODevice::WriteOnly);
    assert(opened);
    f.write("data");
    f.close();
}

// A planned item whose video has already been moved away.
static MediaItem moved_from(const QString& source_path) {
    MediaItem item;
    item.source_path = source_path;
    return item;
}

static void test_removes_folders_without_videos() {
    std::cout << "[Test] Folders left without videos are removed..." << std::endl;
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString root = tmp.path() + "/downloads";

    // Only a subtitle remains
    write_file(root + "/Cheers S04/leftover.srt");
    // A sample file still has a video extension
    write_file(root + "/Movie Pack/movie-sample.mkv");
    // Nested: inner folder holds text, outer only the inner folder
    write_file(root + "/Deep/Inner/readme.txt");
    QDir().mkpath(root + "/Deep");

    const MediaItemList applied = {
        moved_from(root + "/Cheers S04/Cheers_04x05.mkv"),
        moved_from(root + "/Movie Pack/Movie.mkv"),
        moved_from(root + "/Deep/Inner/episode.mkv"),
        moved_from(root + "/Deep/other.mkv"),
        moved_from(root + "/Cheers S04/Cheers_04x06.mkv"),
    };

    CleanupSweep sweep(RelocatorConfig().video_extensions);
    IssueList issues = sweep.cleanup(applied, {root});

    assert(issues.empty());
    assert(!QFileInfo::exists(root + "/Cheers S04"));
    assert(QFileInfo::exists(root + "/Movie Pack/movie-sample.mkv"));
    assert(!QFileInfo::exists(root + "/Deep/Inner"));
    assert(!QFileInfo::exists(root + "/Deep"));
    assert(QFileInfo(root).isDir());
    std::cout << "[PASS] Folders left without videos are removed" << std::endl;
}

static void test_scope_is_limited_to_roots() {
    std::cout << "[Test] Cleanup stays inside source roots..." << std::endl;
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString root = tmp.path() + "/downloads";
    const QString elsewhere = tmp.path() + "/elsewhere";

    write_file(root + "/loose.nfo");
    write_file(elsewhere + "/Show/notes.txt");

    const MediaItemList applied = {
        moved_from(root + "/Movie.mkv"),
        moved_from(elsewhere + "/Show/Episode.mkv"),
        moved_from(tmp.path() + "/downloads-old/Thing.mkv"),
    };
    QDir().mkpath(tmp.path() + "/downloads-old");

    CleanupSweep sweep(RelocatorConfig().video_extensions);
    IssueList issues = sweep.cleanup(applied, {root});

    assert(issues.empty());
    // The root itself is never removed.
    assert(QFileInfo::exists(root + "/loose.nfo"));
    assert(QFileInfo::exists(elsewhere + "/Show/notes.txt"));
    assert(QFileInfo::exists(tmp.path() + "/downloads-old"));
    std::cout << "[PASS] Cleanup stays inside source roots" << std::endl;
}

static void test_missing_folders_are_skipped() {
    std::cout << "[Test] Vanished folders are skipped..." << std::endl;
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString root = tmp.path() + "/downloads";
    QDir().mkpath(root);

    CleanupSweep sweep(RelocatorConfig().video_extensions);
    IssueList issues = sweep.cleanup({moved_from(root + "/Gone/Movie.mkv")}, {root});
    assert(issues.empty());
    std::cout << "[PASS] Vanished folders are skipped" << std::endl;
}

static void test_helpers() {
    std::cout << "[Test] Path containment and video checks..." << std::endl;
    assert(CleanupSweep::is_within("/a/b", "/a"));
    assert(CleanupSweep::is_within("/a/b/c", "/a/"));
    assert(!CleanupSweep::is_within("/a", "/a"));
    assert(!CleanupSweep::is_within("/ab", "/a"));
    assert(!CleanupSweep::is_within("/x/y", "/a"));

    QTemporaryDir tmp;
    assert(tmp.isValid());
    write_file(tmp.path() + "/with/sub/deeper/clip.MP4");
    write_file(tmp.path() + "/without/cover.jpg");

    CleanupSweep sweep(RelocatorConfig().video_extensions);
    assert(sweep.directory_has_videos(tmp.path() + "/with"));
    assert(!sweep.directory_has_videos(tmp.path() + "/without"));
    std::cout << "[PASS] Path containment and video checks" << std::endl;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_removes_folders_without_videos();
    test_scope_is_limited_to_roots();
    test_missing_folders_are_skipped();
    test_helpers();

    std::cout << "[Test] CleanupSweep: all passed" << std::endl;
    return 0;
}
