#include "TitleGuesser.hpp"
#include "NameUtils.hpp"
#include "AppLogger.hpp"
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QProcess>
#include <QStandardPaths>
#include <limits>

namespace {

std::optional<int> json_int(const QJsonValue& value) {
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (!(number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(number);
    }
    if (value.isString()) {
        const int parsed = naming::first_int(value.toString(), -1);
        if (parsed < 0) {
            return std::nullopt;
        }
        return parsed;
    }
    if (value.isArray()) {
        const QJsonArray arr = value.toArray();
        if (!arr.isEmpty()) {
            return json_int(arr.first());
        }
    }
    return std::nullopt;
}

std::vector<int> json_int_list(const QJsonValue& value) {
    std::vector<int> result;
    if (value.isArray()) {
        for (const QJsonValue& v : value.toArray()) {
            if (auto n = json_int(v)) {
                result.push_back(*n);
            }
        }
    } else if (auto n = json_int(value)) {
        result.push_back(*n);
    }
    return result;
}

QString first_string(const QJsonObject& obj, const QStringList& keys) {
    for (const QString& key : keys) {
        const QJsonValue v = obj.value(key);
        if (v.isString() && !v.toString().trimmed().isEmpty()) {
            return v.toString();
        }
    }
    return QString();
}

bool program_exists(const QString& program) {
    if (QFileInfo(program).isAbsolute()) {
        return QFileInfo(program).isExecutable();
    }
    return !QStandardPaths::findExecutable(program).isEmpty();
}

} // namespace

GuessResult guess_from_json(const QJsonObject& obj) {
    GuessResult result;

    result.title = first_string(obj, {"title"});
    result.season = json_int(obj.value("season"));

    if (obj.contains("episode_list")) {
        result.episodes = json_int_list(obj.value("episode_list"));
    }
    if (result.episodes.empty()) {
        result.episodes = json_int_list(obj.value("episode"));
    }

    result.year = json_int(obj.value("year"));
    result.episode_title = first_string(obj, {"episode_title", "episodeName", "episode_name"});
    result.container = first_string(obj, {"container"});

    const QString type = obj.value("type").toString().toLower();
    if (type == "episode") {
        result.kind = GuessKind::Episode;
    } else if (type == "movie") {
        result.kind = GuessKind::Movie;
    }

    return result;
}

ProcessTitleGuesser::ProcessTitleGuesser(const QString& program, int timeout_ms)
    : program_(program)
    , timeout_ms_(timeout_ms) {
}

std::optional<QByteArray> ProcessTitleGuesser::run(const QStringList& args) const {
    QProcess process;
    process.setProgram(program_);
    process.setArguments(args);
    process.start();

    if (!process.waitForStarted(timeout_ms_)) {
        LOG_DEBUG("Guesser", QString("Could not start %1: %2").arg(program_, process.errorString()));
        return std::nullopt;
    }
    if (!process.waitForFinished(timeout_ms_)) {
        LOG_DEBUG("Guesser", QString("%1 timed out after %2 ms").arg(program_).arg(timeout_ms_));
        process.kill();
        process.waitForFinished(1000);
        return std::nullopt;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        LOG_DEBUG("Guesser", QString("%1 exited with code %2").arg(program_).arg(process.exitCode()));
        return std::nullopt;
    }

    return process.readAllStandardOutput();
}

std::optional<GuessResult> ProcessTitleGuesser::guess(const QString& file_name) const {
    if (!is_available()) {
        return std::nullopt;
    }

    auto output = run(arguments_for(file_name));
    if (!output) {
        return std::nullopt;
    }

    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(*output, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_DEBUG("Guesser", QString("%1 returned unusable output for %2: %3")
                  .arg(name(), file_name, parse_error.errorString()));
        return std::nullopt;
    }

    return guess_from_json(doc.object());
}

PtnGuesser::PtnGuesser(const QString& python_program, int timeout_ms)
    : ProcessTitleGuesser(python_program, timeout_ms) {
}

bool PtnGuesser::is_available() const {
    if (!available_) {
        // The interpreter alone is not enough, the module has to import.
        available_ = program_exists(program_) && run({"-c", "import PTN"}).has_value();
        LOG_INFO("Guesser", QString("PTN %1").arg(*available_ ? "available" : "not available"));
    }
    return *available_;
}

QStringList PtnGuesser::arguments_for(const QString& file_name) const {
    static const QString script = QStringLiteral(
        "import json, sys, PTN\n"
        "print(json.dumps(PTN.parse(sys.argv[1]), default=str))\n");
    return {"-c", script, file_name};
}

GuessitGuesser::GuessitGuesser(const QString& guessit_program, int timeout_ms)
    : ProcessTitleGuesser(guessit_program, timeout_ms) {
}

bool GuessitGuesser::is_available() const {
    if (!available_) {
        available_ = program_exists(program_);
        LOG_INFO("Guesser", QString("guessit %1").arg(*available_ ? "available" : "not available"));
    }
    return *available_;
}

QStringList GuessitGuesser::arguments_for(const QString& file_name) const {
    return {"--json", file_name};
}
