#ifndef APP_LOGGER_HPP
#define APP_LOGGER_HPP

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QString>
#include <QTextStream>
#include <deque>
#include <vector>

enum class LogSeverity {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

struct LogEntry {
    QDateTime timestamp;
    LogSeverity severity = LogSeverity::Info;
    QString component;
    QString message;

    // [yyyy-MM-dd hh:mm:ss.zzz] [SEVERITY] [Component] message
    QString format() const;
};

// Process-wide logger. Entries go to <AppDataLocation>/media_relocator.log,
// to stderr when console output is on, and to a bounded in-memory buffer.
// Safe to call from the relocation worker thread.
class AppLogger {
public:
    static AppLogger& instance();

    void set_log_file(const QString& path);
    void set_minimum_severity(LogSeverity sev);
    void set_console_output(bool enabled);
    LogSeverity minimum_severity() const;
    QString log_file_path() const;

    void log(LogSeverity sev, const QString& component, const QString& msg);

    // Newest last. Entries below at_least are skipped.
    std::vector<LogEntry> recent_entries(int count, LogSeverity at_least = LogSeverity::Trace) const;

    // Accepts "trace", "debug", "info", "warning"/"warn", "error", "critical".
    // Unknown names yield fallback.
    static LogSeverity severity_from_name(const QString& name, LogSeverity fallback = LogSeverity::Info);
    static QString severity_label(LogSeverity sev);

private:
    AppLogger();
    ~AppLogger();
    AppLogger(const AppLogger&) = delete;
    AppLogger& operator=(const AppLogger&) = delete;

    void open_default_log();
    void write_line(const QString& line);

    QFile log_file_;
    QTextStream log_stream_;
    LogSeverity min_severity_;
    bool console_enabled_;
    mutable QMutex mutex_;
    std::deque<LogEntry> recent_;
    static constexpr size_t kRecentMax = 500;
};

#define LOG_TRACE(comp, msg) AppLogger::instance().log(LogSeverity::Trace, comp, msg)
#define LOG_DEBUG(comp, msg) AppLogger::instance().log(LogSeverity::Debug, comp, msg)
#define LOG_INFO(comp, msg) AppLogger::instance().log(LogSeverity::Info, comp, msg)
#define LOG_WARN(comp, msg) AppLogger::instance().log(LogSeverity::Warning, comp, msg)
#define LOG_ERROR(comp, msg) AppLogger::instance().log(LogSeverity::Error, comp, msg)
#define LOG_CRITICAL(comp, msg) AppLogger::instance().log(LogSeverity::Critical, comp, msg)

#endif // APP_LOGGER_HPP
