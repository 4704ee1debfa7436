#include "RelocatorConfig.hpp"
#include <QFileInfo>
#include <QSettings>
#include <algorithm>

RelocatorConfig::RelocatorConfig()
    : video_extensions({".avi", ".mkv", ".mp4", ".mov", ".wmv", ".flv"})
    , companion_extensions({".srt", ".sub", ".idx", ".nfo", ".jpg", ".jpeg", ".png", ".txt"})
    , sample_pattern(R"((sample|trailer|\b(rarbg|yts|ettv|eztv)\b))")
    , hidden_prefix(".")
    , chunk_size(kDefaultChunkSize)
    , ptn_enabled(true)
    , guessit_enabled(true)
    , python_program("python3")
    , guessit_program("guessit")
    , guesser_timeout_ms(5000)
    , log_level(LogSeverity::Info) {
}

RelocatorConfig RelocatorConfig::load(QSettings& settings) {
    RelocatorConfig config;

    config.source_roots = settings.value("paths/sources", config.source_roots).toStringList();
    config.destination_root = settings.value("paths/destination", config.destination_root).toString().trimmed();

    config.video_extensions = normalize_extensions(
        settings.value("media/video_extensions", config.video_extensions).toStringList());
    config.companion_extensions = normalize_extensions(
        settings.value("media/companion_extensions", config.companion_extensions).toStringList());
    config.sample_pattern = settings.value("media/sample_pattern", config.sample_pattern).toString();

    QString default_ext = settings.value("media/default_extension", config.layout.default_extension).toString().trimmed();
    if (!default_ext.isEmpty() && !default_ext.startsWith('.')) {
        default_ext.prepend('.');
    }
    if (!default_ext.isEmpty()) {
        config.layout.default_extension = default_ext;
    }

    config.layout.movies_folder = settings.value("layout/movies_folder", config.layout.movies_folder).toString();
    config.layout.series_folder = settings.value("layout/series_folder", config.layout.series_folder).toString();
    config.layout.season_prefix = settings.value("layout/season_prefix", config.layout.season_prefix).toString();

    config.chunk_size = std::max(kMinChunkSize,
        settings.value("transfer/chunk_size", config.chunk_size).toLongLong());

    config.ptn_enabled = settings.value("guessers/ptn_enabled", config.ptn_enabled).toBool();
    config.guessit_enabled = settings.value("guessers/guessit_enabled", config.guessit_enabled).toBool();
    config.python_program = settings.value("guessers/python", config.python_program).toString();
    config.guessit_program = settings.value("guessers/guessit", config.guessit_program).toString();
    config.guesser_timeout_ms = settings.value("guessers/timeout_ms", config.guesser_timeout_ms).toInt();

    config.log_level = AppLogger::severity_from_name(settings.value("log/level", "info").toString());

    return config;
}

bool RelocatorConfig::validate(IssueList& issues) const {
    const size_t before = issues.size();
    auto fail = [&issues](const QString& path, const QString& message) {
        issues.push_back({IssueKind::ConfigError, path, message});
        LOG_ERROR("Config", QString("%1: %2").arg(path, message));
    };

    if (source_roots.isEmpty()) {
        fail(QString(), "No source folders configured");
    }
    for (const QString& root : source_roots) {
        if (root.trimmed().isEmpty() || !QFileInfo(root).isDir()) {
            fail(root, "Source folder does not exist");
        }
    }

    if (destination_root.trimmed().isEmpty()) {
        fail(QString(), "No destination folder configured");
    } else {
        QFileInfo dest(destination_root);
        if (dest.exists() && !dest.isDir()) {
            fail(destination_root, "Destination exists but is not a folder");
        }
    }

    if (video_extensions.isEmpty()) {
        fail(QString(), "No video extensions configured");
    }
    if (!sample_matcher().isValid()) {
        fail(sample_pattern, QString("Invalid sample pattern: %1").arg(sample_matcher().errorString()));
    }

    return issues.size() == before;
}

QStringList RelocatorConfig::normalize_extensions(const QStringList& extensions) {
    QStringList result;
    for (QString ext : extensions) {
        ext = ext.trimmed().toLower();
        if (ext.isEmpty()) continue;
        if (!ext.startsWith('.')) {
            ext.prepend('.');
        }
        if (!result.contains(ext)) {
            result.append(ext);
        }
    }
    return result;
}

bool RelocatorConfig::has_extension_in(const QString& file_name, const QStringList& extensions) {
    const int dot = file_name.lastIndexOf('.');
    if (dot < 0) {
        return false;
    }
    return extensions.contains(file_name.mid(dot).toLower());
}

bool RelocatorConfig::is_video_file(const QString& file_name) const {
    return has_extension_in(file_name, video_extensions);
}

bool RelocatorConfig::is_companion_file(const QString& file_name) const {
    return has_extension_in(file_name, companion_extensions);
}

QRegularExpression RelocatorConfig::sample_matcher() const {
    return QRegularExpression(sample_pattern, QRegularExpression::CaseInsensitiveOption);
}

bool RelocatorConfig::is_sample_name(const QString& file_name) const {
    if (sample_pattern.isEmpty()) {
        return false;
    }
    return sample_matcher().match(file_name).hasMatch();
}

bool RelocatorConfig::is_hidden_name(const QString& name) const {
    return !hidden_prefix.isEmpty() && name.startsWith(hidden_prefix);
}
