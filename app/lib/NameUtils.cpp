#include "NameUtils.hpp"
#include <QRegularExpression>
#include <QStringList>

namespace naming {

namespace {
    const QString kInvalidFileChars = QStringLiteral("<>:\"/\\|?*");

    const QRegularExpression& whitespace_run() {
        static const QRegularExpression rx(R"(\s+)");
        return rx;
    }
}

QString trim_chars(const QString& text, const QString& chars) {
    int begin = 0;
    int end = text.size();
    while (begin < end && chars.contains(text.at(begin))) {
        ++begin;
    }
    while (end > begin && chars.contains(text.at(end - 1))) {
        --end;
    }
    return text.mid(begin, end - begin);
}

QString strip_release_tags(const QString& stem) {
    static const QRegularExpression trailing_tag(R"(\s*(?:\[[^\]]*\]|\([^\)]*\))\s*$)");
    static const QRegularExpression wide_dash(R"(\s*[\x{2013}\x{2014}]\s*)");

    QString s = stem;
    while (true) {
        QString next = s;
        next.remove(trailing_tag);
        if (next == s) {
            break;
        }
        s = next;
    }

    s.replace(wide_dash, " - ");
    s.replace(whitespace_run(), " ");
    return trim_chars(s, " -");
}

QString beautify_spaces(const QString& text) {
    static const QRegularExpression dangling_dash(R"(\s*[\-\x{2013}\x{2014}]\s*$)");

    QString t = text;
    t.replace('_', ' ');
    t.replace('.', ' ');
    t.remove(dangling_dash);
    t.replace(whitespace_run(), " ");
    return t.trimmed();
}

QString clean_stem(const QString& stem) {
    return beautify_spaces(strip_release_tags(stem));
}

QString clean_episode_title(const QString& text) {
    static const QRegularExpression leading_separators(R"(^[\s.\-_:\x{2013}\x{2014}]+)");
    static const QRegularExpression leading_token(
        R"(^(S?\s*\d{1,2}\s*[xE]\s*\d{1,3})(?:\s*[-_.])?\s*)",
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression trailing_token(
        R"(\s*(?:[-_.])?\s*(S?\s*\d{1,2}\s*[xE]\s*\d{1,3})\s*$)",
        QRegularExpression::CaseInsensitiveOption);

    QString s = text;
    s.remove(leading_separators);
    s.remove(leading_token);
    s.remove(trailing_token);
    return beautify_spaces(strip_release_tags(s));
}

int first_int(const QString& text, int fallback) {
    static const QRegularExpression digits(R"(\d+)");
    const QRegularExpressionMatch m = digits.match(text);
    if (!m.hasMatch()) {
        return fallback;
    }
    bool ok = false;
    const int value = m.captured(0).toInt(&ok);
    return ok ? value : fallback;
}

int positive_int(const QString& text) {
    const int value = first_int(text, 1);
    return value > 0 ? value : 1;
}

QString episode_label(int season, const std::vector<int>& episodes) {
    const int first = episodes.empty() ? 1 : episodes.front();
    QString label = QString("%1x%2")
        .arg(season, 2, 10, QChar('0'))
        .arg(first, 2, 10, QChar('0'));
    if (episodes.size() > 1) {
        label += QString("-%1").arg(episodes.back(), 2, 10, QChar('0'));
    }
    return label;
}

bool is_reserved_device_name(const QString& base_name) {
    static const QStringList reserved = [] {
        QStringList names = {"CON", "PRN", "AUX", "NUL"};
        for (int i = 1; i <= 9; ++i) {
            names << QString("COM%1").arg(i) << QString("LPT%1").arg(i);
        }
        return names;
    }();
    return reserved.contains(base_name.trimmed().toUpper());
}

QString sanitize_filename(const QString& name) {
    QString out;
    out.reserve(name.size());
    for (const QChar c : name) {
        if (kInvalidFileChars.contains(c) || c.unicode() < 0x20) {
            out += '_';
        } else {
            out += c;
        }
    }

    out.replace(whitespace_run(), " ");
    out = out.trimmed();
    // Windows drops trailing dots and spaces from names.
    while (out.endsWith('.') || out.endsWith(' ')) {
        out.chop(1);
    }

    const int dot = out.indexOf('.');
    const QString base = dot < 0 ? out : out.left(dot);
    if (is_reserved_device_name(base)) {
        out.prepend('_');
    }
    return out;
}

QString format_bytes(qint64 bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    return QString("%1 %2").arg(value, 0, 'f', 1).arg(units[unit]);
}

} // namespace naming
