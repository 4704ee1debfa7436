#ifndef NAME_UTILS_HPP
#define NAME_UTILS_HPP

#include <QString>
#include <QtGlobal>
#include <vector>

namespace naming {
    // Repeatedly drops trailing "[...]" / "(...)" release tags, turns en/em
    // dashes into " - " and trims spaces and dashes from both ends.
    QString strip_release_tags(const QString& stem);

    // "_" and "." become spaces, a dangling trailing dash is dropped and
    // whitespace runs collapse to one space.
    QString beautify_spaces(const QString& text);

    // Both of the above: the form every matching rule works on.
    QString clean_stem(const QString& stem);

    // Text after a season/episode token: leading separators go, a repeated
    // season/episode token at either end goes, tags are stripped again.
    QString clean_episode_title(const QString& text);

    // First run of digits in text, or fallback when there is none.
    int first_int(const QString& text, int fallback);

    // first_int() clamped to a positive value; anything unparsable is 1.
    int positive_int(const QString& text);

    // "04x05" or "04x05-06" (first and last episode).
    QString episode_label(int season, const std::vector<int>& episodes);

    bool is_reserved_device_name(const QString& base_name);

    // Illegal filesystem characters and control characters become "_",
    // whitespace collapses, trailing dots and spaces are dropped,
    // reserved device names get a "_" prefix.
    QString sanitize_filename(const QString& name);

    QString format_bytes(qint64 bytes);

    // Removes the given characters from both ends of text.
    QString trim_chars(const QString& text, const QString& chars);
}

#endif // NAME_UTILS_HPP
