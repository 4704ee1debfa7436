#ifndef RELOCATOR_CONFIG_HPP
#define RELOCATOR_CONFIG_HPP

#include "AppLogger.hpp"
#include "PathPlanner.hpp"
#include "RelocationIssue.hpp"
#include <QString>
#include <QStringList>
#include <QRegularExpression>

class QSettings;

struct RelocatorConfig {
    QStringList source_roots;
    QString destination_root;

    // Lower-case, leading dot
    QStringList video_extensions;
    QStringList companion_extensions;
    QString sample_pattern;
    QString hidden_prefix;

    LibraryLayout layout;
    qint64 chunk_size;

    bool ptn_enabled;
    bool guessit_enabled;
    QString python_program;
    QString guessit_program;
    int guesser_timeout_ms;

    LogSeverity log_level;

    RelocatorConfig();

    // Missing keys keep their defaults.
    static RelocatorConfig load(QSettings& settings);

    // Appends a ConfigError for each problem; false when any was found.
    bool validate(IssueList& issues) const;

    bool is_video_file(const QString& file_name) const;
    bool is_companion_file(const QString& file_name) const;
    bool is_sample_name(const QString& file_name) const;
    bool is_hidden_name(const QString& name) const;

    // Case-insensitive matcher for sample_pattern.
    QRegularExpression sample_matcher() const;

    static constexpr qint64 kDefaultChunkSize = 1024 * 1024;
    static constexpr qint64 kMinChunkSize = 4096;

private:
    static QStringList normalize_extensions(const QStringList& extensions);
    static bool has_extension_in(const QString& file_name, const QStringList& extensions);
};

#endif // RELOCATOR_CONFIG_HPP
