#ifndef RELOCATION_ISSUE_HPP
#define RELOCATION_ISSUE_HPP

#include <QString>
#include <QStringList>
#include <QMetaType>
#include <vector>

enum class IssueKind {
    AnalysisWarning,  // file dropped from the plan
    ConfigError,      // bad source/destination setup, nothing was started
    MoveError,        // one primary or companion file was not relocated
    CleanupError      // one source folder could not be removed
};

struct RelocationIssue {
    IssueKind kind = IssueKind::MoveError;
    QString path;
    QString message;

    // "<Kind>: <path>: <message>"
    QString describe() const;
};

using IssueList = std::vector<RelocationIssue>;

QString issue_kind_label(IssueKind kind);
QStringList describe_issues(const IssueList& issues);

Q_DECLARE_METATYPE(IssueList)

#endif // RELOCATION_ISSUE_HPP
