#include "RelocationIssue.hpp"

QString issue_kind_label(IssueKind kind) {
    switch (kind) {
        case IssueKind::AnalysisWarning: return "Analysis warning";
        case IssueKind::ConfigError:     return "Configuration error";
        case IssueKind::MoveError:       return "Move error";
        case IssueKind::CleanupError:    return "Cleanup error";
    }
    return "Issue";
}

QString RelocationIssue::describe() const {
    if (path.isEmpty()) {
        return QString("%1: %2").arg(issue_kind_label(kind), message);
    }
    return QString("%1: %2: %3").arg(issue_kind_label(kind), path, message);
}

QStringList describe_issues(const IssueList& issues) {
    QStringList lines;
    for (const auto& issue : issues) {
        lines.append(issue.describe());
    }
    return lines;
}
