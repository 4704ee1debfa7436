#include "AppLogger.hpp"
#include <QDir>
#include <QStandardPaths>
#include <algorithm>
#include <iostream>

QString LogEntry::format() const {
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp.toString("yyyy-MM-dd hh:mm:ss.zzz"),
             AppLogger::severity_label(severity), component, message);
}

AppLogger& AppLogger::instance() {
    static AppLogger logger_instance;
    return logger_instance;
}

AppLogger::AppLogger()
    : min_severity_(LogSeverity::Info)
    , console_enabled_(true) {
    open_default_log();
}

AppLogger::~AppLogger() {
    if (log_file_.isOpen()) {
        log_stream_.flush();
        log_file_.close();
    }
}

void AppLogger::open_default_log() {
    QString app_data = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (app_data.isEmpty()) {
        app_data = QDir::tempPath();
    }

    QDir dir(app_data);
    if (!dir.exists() && !dir.mkpath(".")) {
        std::cerr << "Could not create log directory " << app_data.toStdString() << std::endl;
        return;
    }

    set_log_file(dir.filePath("media_relocator.log"));
}

void AppLogger::set_log_file(const QString& path) {
    QMutexLocker locker(&mutex_);

    if (log_file_.isOpen()) {
        log_stream_.flush();
        log_file_.close();
    }

    log_file_.setFileName(path);
    if (!log_file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        log_stream_.setDevice(nullptr);
        std::cerr << "Could not open log file " << path.toStdString() << ": "
                  << log_file_.errorString().toStdString() << std::endl;
        return;
    }

    log_stream_.setDevice(&log_file_);
    write_line(QString("=== Relocator session started at %1 ===")
               .arg(QDateTime::currentDateTime().toString(Qt::ISODate)));
}

void AppLogger::set_minimum_severity(LogSeverity sev) {
    QMutexLocker locker(&mutex_);
    min_severity_ = sev;
}

void AppLogger::set_console_output(bool enabled) {
    QMutexLocker locker(&mutex_);
    console_enabled_ = enabled;
}

LogSeverity AppLogger::minimum_severity() const {
    QMutexLocker locker(&mutex_);
    return min_severity_;
}

QString AppLogger::log_file_path() const {
    QMutexLocker locker(&mutex_);
    return log_file_.fileName();
}

QString AppLogger::severity_label(LogSeverity sev) {
    switch (sev) {
        case LogSeverity::Trace:    return "TRACE";
        case LogSeverity::Debug:    return "DEBUG";
        case LogSeverity::Info:     return "INFO";
        case LogSeverity::Warning:  return "WARN";
        case LogSeverity::Error:    return "ERROR";
        case LogSeverity::Critical: return "CRIT";
    }
    return "???";
}

LogSeverity AppLogger::severity_from_name(const QString& name, LogSeverity fallback) {
    const QString key = name.trimmed().toLower();
    if (key == "trace") return LogSeverity::Trace;
    if (key == "debug") return LogSeverity::Debug;
    if (key == "info") return LogSeverity::Info;
    if (key == "warning" || key == "warn") return LogSeverity::Warning;
    if (key == "error") return LogSeverity::Error;
    if (key == "critical" || key == "crit") return LogSeverity::Critical;
    return fallback;
}

// Caller holds mutex_.
void AppLogger::write_line(const QString& line) {
    if (log_stream_.device()) {
        log_stream_ << line << "\n";
        log_stream_.flush();
    }
}

void AppLogger::log(LogSeverity sev, const QString& component, const QString& msg) {
    QMutexLocker locker(&mutex_);
    if (sev < min_severity_) return;

    LogEntry entry{QDateTime::currentDateTime(), sev, component, msg};
    const QString line = entry.format();
    write_line(line);

    recent_.push_back(std::move(entry));
    while (recent_.size() > kRecentMax) {
        recent_.pop_front();
    }

    if (console_enabled_) {
        std::cerr << line.toStdString() << std::endl;
    }
}

std::vector<LogEntry> AppLogger::recent_entries(int count, LogSeverity at_least) const {
    QMutexLocker locker(&mutex_);

    std::vector<LogEntry> result;
    for (auto it = recent_.rbegin(); it != recent_.rend() && static_cast<int>(result.size()) < count; ++it) {
        if (it->severity >= at_least) {
            result.push_back(*it);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}
