#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include "NameUtils.hpp"

static void test_release_tags() {
    std::cout << "[Test] Release tag stripping..." << std::endl;
    assert(naming::strip_release_tags("Movie Name (2010) [1080p]") == "Movie Name");
    assert(naming::strip_release_tags("Show [x264] [HDTV] ") == "Show");
    assert(naming::strip_release_tags("Title \xE2\x80\x93 Part") == "Title - Part");
    assert(naming::clean_stem("Some_Movie.Name [YTS]") == "Some Movie Name");
    assert(naming::beautify_spaces("a__b...c -") == "a b c");
    std::cout << "[PASS] Release tag stripping" << std::endl;
}

static void test_episode_title_cleanup() {
    std::cout << "[Test] Episode title cleanup..." << std::endl;
    assert(naming::clean_episode_title("-Tortilla") == "Tortilla");
    assert(naming::clean_episode_title(" - The Pilot [720p]") == "The Pilot");
    assert(naming::clean_episode_title("_Finale 2x10") == "Finale");
    assert(naming::clean_episode_title("").isEmpty());
    std::cout << "[PASS] Episode title cleanup" << std::endl;
}

static void test_numbers() {
    std::cout << "[Test] Number parsing..." << std::endl;
    assert(naming::first_int("E05x", 1) == 5);
    assert(naming::first_int("none", 7) == 7);
    assert(naming::positive_int("0") == 1);
    assert(naming::positive_int("abc") == 1);
    assert(naming::positive_int("12") == 12);
    std::cout << "[PASS] Number parsing" << std::endl;
}

static void test_episode_labels() {
    std::cout << "[Test] Episode labels..." << std::endl;
    assert(naming::episode_label(4, {5}) == "04x05");
    assert(naming::episode_label(1, {1, 2, 3}) == "01x01-03");
    assert(naming::episode_label(12, {105}) == "12x105");
    assert(naming::episode_label(2, {}) == "02x01");
    std::cout << "[PASS] Episode labels" << std::endl;
}

static void test_sanitize() {
    std::cout << "[Test] File name sanitizing..." << std::endl;
    assert(naming::sanitize_filename("a<b>c:d") == "a_b_c_d");
    assert(naming::sanitize_filename("What?/Why*|\"\\") == "What__Why____");
    assert(naming::sanitize_filename("  lots   of \t space ") == "lots of space");
    assert(naming::sanitize_filename(QString("tab") + QChar(0x01) + "x") == "tab_x");

    assert(naming::sanitize_filename("CON") == "_CON");
    assert(naming::sanitize_filename("con.mkv") == "_con.mkv");
    assert(naming::sanitize_filename("Lpt9.srt") == "_Lpt9.srt");
    assert(naming::sanitize_filename("Console.mkv") == "Console.mkv");

    assert(naming::sanitize_filename("Mr. Robot...") == "Mr. Robot");
    assert(naming::sanitize_filename("Season 04 . ") == "Season 04");
    assert(naming::sanitize_filename("S.W.A.T.") == "S.W.A.T");
    assert(naming::is_reserved_device_name("aux"));
    assert(!naming::is_reserved_device_name("COM10"));

    const QString forbidden = "<>:\"/\\|?*";
    const QString cleaned = naming::sanitize_filename("Star Trek: TNG <Best of> \"Both\" Worlds?");
    for (const QChar c : forbidden) {
        assert(!cleaned.contains(c));
    }
    std::cout << "[PASS] File name sanitizing" << std::endl;
}

static void test_format_bytes() {
    std::cout << "[Test] Byte formatting..." << std::endl;
    assert(naming::format_bytes(0) == "0.0 B");
    assert(naming::format_bytes(1536) == "1.5 KB");
    assert(naming::format_bytes(3LL * 1024 * 1024 * 1024) == "3.0 GB");
    std::cout << "[PASS] Byte formatting" << std::endl;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_release_tags();
    test_episode_title_cleanup();
    test_numbers();
    test_episode_labels();
    test_sanitize();
    test_format_bytes();

    std::cout << "[Test] NameUtils: all passed" << std::endl;
    return 0;
}
