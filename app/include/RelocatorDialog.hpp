#ifndef RELOCATOR_DIALOG_HPP
#define RELOCATOR_DIALOG_HPP

#include "MediaTypes.hpp"
#include "RelocationIssue.hpp"
#include "RelocatorConfig.hpp"
#include "SelectionTree.hpp"
#include <QDialog>
#include <QThread>

class QLabel;
class QLineEdit;
class QListWidget;
class QProgressBar;
class QPushButton;
class QTreeView;
class RelocationWorker;
class SelectionTreeModel;

class RelocatorDialog : public QDialog {
    Q_OBJECT

public:
    explicit RelocatorDialog(const RelocatorConfig& config, QWidget* parent = nullptr);
    ~RelocatorDialog() override;

signals:
    // Queued into the worker thread
    void check_guessers_requested();
    void analyze_requested(const QStringList& source_roots, const QString& destination_root);
    void apply_requested(const MediaItemList& items, const QStringList& source_roots);

private slots:
    void add_source();
    void remove_selected_sources();
    void pick_destination();
    void on_analyze();
    void on_apply();

    void on_guessers_checked(const QStringList& available, const QStringList& missing);
    void on_analysis_finished(const MediaItemList& items, const IssueList& warnings);
    void on_progress(qint64 bytes_done, qint64 bytes_total, const QString& label);
    void on_apply_finished(int files_moved, qint64 bytes_moved, const IssueList& issues);
    void on_selection_changed(int selected_count);

private:
    void build_interface();
    void start_worker();
    void set_busy(bool busy);
    void show_issues(const QString& title, const IssueList& issues);
    QStringList current_sources() const;

    // Validates the session's roots; shows the ConfigErrors when they fail.
    bool validate_session(RelocatorConfig& session);

    RelocatorConfig config_;
    SelectionTree tree_;
    SelectionTreeModel* model_;

    QThread worker_thread_;
    RelocationWorker* worker_;
    bool busy_;
    QStringList batch_sources_;

    QLabel* guesser_banner_;
    QListWidget* source_list_;
    QLineEdit* destination_edit_;
    QPushButton* analyze_btn_;
    QPushButton* apply_btn_;
    QTreeView* plan_view_;
    QProgressBar* progress_bar_;
    QLabel* status_label_;
};

#endif // RELOCATOR_DIALOG_HPP
