#ifndef TITLE_GUESSER_HPP
#define TITLE_GUESSER_HPP

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QJsonObject>
#include <optional>
#include <vector>

enum class GuessKind {
    Unknown,
    Episode,
    Movie
};

// Normalized opinion of an external guesser about one file name.
struct GuessResult {
    GuessKind kind = GuessKind::Unknown;
    QString title;
    std::optional<int> season;
    std::vector<int> episodes;
    std::optional<int> year;
    QString episode_title;
    QString container;

    bool has_episode_info() const { return season.has_value() || !episodes.empty(); }
};

// Optional external capability. Implementations fail closed: an unavailable
// tool or unusable output is std::nullopt, never an error.
class TitleGuesser {
public:
    virtual ~TitleGuesser() = default;

    virtual QString name() const = 0;
    virtual bool is_available() const = 0;
    virtual std::optional<GuessResult> guess(const QString& file_name) const = 0;
};

// Maps the dictionary shapes produced by PTN and guessit onto GuessResult.
// Numeric fields accept numbers, numeric strings or arrays of either.
GuessResult guess_from_json(const QJsonObject& obj);

// Runs a command line tool that prints one JSON object on stdout.
class ProcessTitleGuesser : public TitleGuesser {
public:
    ProcessTitleGuesser(const QString& program, int timeout_ms);

    std::optional<GuessResult> guess(const QString& file_name) const override;

protected:
    virtual QStringList arguments_for(const QString& file_name) const = 0;

    // Runs program_ with args; nullopt on start failure, timeout or non-zero exit.
    std::optional<QByteArray> run(const QStringList& args) const;

    QString program_;
    int timeout_ms_;
};

// parse-torrent-name through the Python interpreter.
class PtnGuesser : public ProcessTitleGuesser {
public:
    explicit PtnGuesser(const QString& python_program = "python3", int timeout_ms = 5000);

    QString name() const override { return "PTN"; }
    bool is_available() const override;

protected:
    QStringList arguments_for(const QString& file_name) const override;

private:
    mutable std::optional<bool> available_;
};

// guessit command line interface ("guessit --json <name>").
class GuessitGuesser : public ProcessTitleGuesser {
public:
    explicit GuessitGuesser(const QString& guessit_program = "guessit", int timeout_ms = 5000);

    QString name() const override { return "guessit"; }
    bool is_available() const override;

protected:
    QStringList arguments_for(const QString& file_name) const override;

private:
    mutable std::optional<bool> available_;
};

#endif // TITLE_GUESSER_HPP
