#ifndef RELOCATION_WORKER_HPP
#define RELOCATION_WORKER_HPP

#include "MediaTypes.hpp"
#include "RelocationIssue.hpp"
#include "RelocatorConfig.hpp"
#include "TitleGuesser.hpp"
#include <QObject>
#include <QStringList>
#include <memory>

// Runs analysis and move batches. Lives on a worker QThread; every slot is
// invoked through a queued connection and answers with a signal.
class RelocationWorker : public QObject {
    Q_OBJECT

public:
    explicit RelocationWorker(const RelocatorConfig& config, QObject* parent = nullptr);

    // Registers the types carried by the worker's signals.
    static void register_meta_types();

public slots:
    void check_guessers();
    void analyze(const QStringList& source_roots, const QString& destination_root);
    void apply(const MediaItemList& items, const QStringList& source_roots);

signals:
    void guessers_checked(const QStringList& available, const QStringList& missing);
    void analysis_finished(const MediaItemList& items, const IssueList& warnings);
    void progress(qint64 bytes_done, qint64 bytes_total, const QString& label);
    void apply_finished(int files_moved, qint64 bytes_moved, const IssueList& issues);

private:
    RelocatorConfig config_;
    std::shared_ptr<TitleGuesser> primary_guesser_;
    std::shared_ptr<TitleGuesser> secondary_guesser_;
};

#endif // RELOCATION_WORKER_HPP
