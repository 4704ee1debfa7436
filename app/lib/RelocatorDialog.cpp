#include "RelocatorDialog.hpp"
#include "AppLogger.hpp"
#include "NameUtils.hpp"
#include "RelocationWorker.hpp"
#include "SelectionTreeModel.hpp"
#include "ui_constants.hpp"
#include <QDir>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QTreeView>
#include <QVBoxLayout>

namespace {

// Progress bars hold an int; bytes are scaled to a fixed range.
constexpr int kProgressRange = 10000;

QString button_style(const QString& bg, const QString& hover) {
    return QString("QPushButton { padding: 8px 16px; background-color: %1; color: white; border: none; }"
                   "QPushButton:hover { background-color: %2; }"
                   "QPushButton:disabled { background-color: #404040; color: #777777; }")
        .arg(bg, hover);
}

} // namespace

RelocatorDialog::RelocatorDialog(const RelocatorConfig& config, QWidget* parent)
    : QDialog(parent)
    , config_(config)
    , model_(nullptr)
    , worker_(nullptr)
    , busy_(false)
    , guesser_banner_(nullptr)
    , source_list_(nullptr)
    , destination_edit_(nullptr)
    , analyze_btn_(nullptr)
    , apply_btn_(nullptr)
    , plan_view_(nullptr)
    , progress_bar_(nullptr)
    , status_label_(nullptr) {

    setWindowTitle("Media Relocator");
    setMinimumSize(ui::scaling::scaled(ui::dimensions::kRelocatorMinWidth),
                   ui::scaling::scaled(ui::dimensions::kRelocatorMinHeight));

    build_interface();
    start_worker();

    emit check_guessers_requested();
}

RelocatorDialog::~RelocatorDialog() {
    // A running batch cannot be interrupted; wait for it to finish.
    worker_thread_.quit();
    worker_thread_.wait();
}

void RelocatorDialog::start_worker() {
    RelocationWorker::register_meta_types();

    worker_ = new RelocationWorker(config_);
    worker_->moveToThread(&worker_thread_);
    connect(&worker_thread_, &QThread::finished, worker_, &QObject::deleteLater);

    connect(this, &RelocatorDialog::check_guessers_requested, worker_, &RelocationWorker::check_guessers);
    connect(this, &RelocatorDialog::analyze_requested, worker_, &RelocationWorker::analyze);
    connect(this, &RelocatorDialog::apply_requested, worker_, &RelocationWorker::apply);

    connect(worker_, &RelocationWorker::guessers_checked, this, &RelocatorDialog::on_guessers_checked);
    connect(worker_, &RelocationWorker::analysis_finished, this, &RelocatorDialog::on_analysis_finished);
    connect(worker_, &RelocationWorker::progress, this, &RelocatorDialog::on_progress);
    connect(worker_, &RelocationWorker::apply_finished, this, &RelocatorDialog::on_apply_finished);

    worker_thread_.start();
}

void RelocatorDialog::build_interface() {
    auto* root_layout = new QVBoxLayout(this);
    root_layout->setContentsMargins(15, 15, 15, 15);
    root_layout->setSpacing(10);

    // Optional guesser status
    guesser_banner_ = new QLabel("Checking optional title guessers...");
    guesser_banner_->setWordWrap(true);
    guesser_banner_->setStyleSheet(QString("padding: 8px 12px; color: %1;").arg(ui::colors::kMutedText));
    root_layout->addWidget(guesser_banner_);

    // Source folders
    auto* sources_label = new QLabel("Source folders:");
    sources_label->setStyleSheet("font-weight: bold; font-size: 12px;");
    root_layout->addWidget(sources_label);

    auto* sources_row = new QHBoxLayout();
    source_list_ = new QListWidget();
    source_list_->setSelectionMode(QAbstractItemView::ExtendedSelection);
    source_list_->setMaximumHeight(ui::scaling::scaled(ui::dimensions::kSourceListHeight));
    source_list_->setStyleSheet(
        "QListWidget { background-color: #2d2d2d; border: 1px solid #404040; color: #dddddd; }"
        "QListWidget::item { padding: 3px 8px; }"
    );
    for (const QString& root : config_.source_roots) {
        source_list_->addItem(root);
    }
    sources_row->addWidget(source_list_, 1);

    auto* source_buttons = new QVBoxLayout();
    auto* add_source_btn = new QPushButton("Add folder...");
    connect(add_source_btn, &QPushButton::clicked, this, &RelocatorDialog::add_source);
    source_buttons->addWidget(add_source_btn);
    auto* remove_source_btn = new QPushButton("Remove selected");
    connect(remove_source_btn, &QPushButton::clicked, this, &RelocatorDialog::remove_selected_sources);
    source_buttons->addWidget(remove_source_btn);
    source_buttons->addStretch();
    sources_row->addLayout(source_buttons);
    root_layout->addLayout(sources_row);

    // Destination
    auto* dest_row = new QHBoxLayout();
    auto* dest_label = new QLabel("Destination library:");
    dest_label->setStyleSheet("font-weight: bold; font-size: 12px;");
    dest_row->addWidget(dest_label);
    destination_edit_ = new QLineEdit(config_.destination_root);
    destination_edit_->setPlaceholderText("Folder that will hold Movies/ and Series/");
    dest_row->addWidget(destination_edit_, 1);
    auto* pick_dest_btn = new QPushButton("Select...");
    pick_dest_btn->setStyleSheet(button_style(ui::colors::kAccent, ui::colors::kAccentHover));
    connect(pick_dest_btn, &QPushButton::clicked, this, &RelocatorDialog::pick_destination);
    dest_row->addWidget(pick_dest_btn);
    root_layout->addLayout(dest_row);

    // Actions
    auto* action_row = new QHBoxLayout();
    analyze_btn_ = new QPushButton("Analyze");
    analyze_btn_->setMinimumSize(ui::scaling::scaled(ui::dimensions::kActionButtonWidth),
                                 ui::scaling::scaled(ui::dimensions::kActionButtonHeight));
    analyze_btn_->setStyleSheet(button_style(ui::colors::kAccent, ui::colors::kAccentHover));
    connect(analyze_btn_, &QPushButton::clicked, this, &RelocatorDialog::on_analyze);
    action_row->addWidget(analyze_btn_);

    apply_btn_ = new QPushButton("Move selected");
    apply_btn_->setMinimumSize(ui::scaling::scaled(ui::dimensions::kActionButtonWidth),
                               ui::scaling::scaled(ui::dimensions::kActionButtonHeight));
    apply_btn_->setStyleSheet(button_style(ui::colors::kMoveColor, ui::colors::kMoveHover));
    apply_btn_->setEnabled(false);
    connect(apply_btn_, &QPushButton::clicked, this, &RelocatorDialog::on_apply);
    action_row->addWidget(apply_btn_);
    action_row->addStretch();
    root_layout->addLayout(action_row);

    // Plan
    model_ = new SelectionTreeModel(tree_, this);
    connect(model_, &SelectionTreeModel::selection_changed, this, &RelocatorDialog::on_selection_changed);

    plan_view_ = new QTreeView();
    plan_view_->setModel(model_);
    plan_view_->setUniformRowHeights(true);
    plan_view_->header()->setStretchLastSection(true);
    plan_view_->setStyleSheet(
        "QTreeView { background-color: #2d2d2d; border: 1px solid #404040; color: #dddddd; }"
    );
    root_layout->addWidget(plan_view_, 1);

    // Progress
    progress_bar_ = new QProgressBar();
    progress_bar_->setRange(0, kProgressRange);
    progress_bar_->setValue(0);
    progress_bar_->setTextVisible(false);
    progress_bar_->setFixedHeight(ui::scaling::scaled(ui::dimensions::kProgressBarHeight));
    root_layout->addWidget(progress_bar_);

    status_label_ = new QLabel("Add source folders and press Analyze.");
    status_label_->setStyleSheet(QString("color: %1; font-size: 11px;").arg(ui::colors::kMutedText));
    root_layout->addWidget(status_label_);
}

QStringList RelocatorDialog::current_sources() const {
    QStringList sources;
    for (int i = 0; i < source_list_->count(); ++i) {
        sources.append(source_list_->item(i)->text());
    }
    return sources;
}

void RelocatorDialog::add_source() {
    QString dir = QFileDialog::getExistingDirectory(this, "Add source folder");
    if (dir.isEmpty()) {
        return;
    }
    dir = QDir::cleanPath(dir);
    if (!current_sources().contains(dir)) {
        source_list_->addItem(dir);
        LOG_INFO("Dialog", QString("Added source folder: %1").arg(dir));
    }
}

void RelocatorDialog::remove_selected_sources() {
    const auto selected = source_list_->selectedItems();
    for (QListWidgetItem* item : selected) {
        LOG_INFO("Dialog", QString("Removed source folder: %1").arg(item->text()));
        delete source_list_->takeItem(source_list_->row(item));
    }
}

void RelocatorDialog::pick_destination() {
    const QString dir = QFileDialog::getExistingDirectory(this, "Select destination library",
                                                          destination_edit_->text());
    if (!dir.isEmpty()) {
        destination_edit_->setText(QDir::cleanPath(dir));
    }
}

bool RelocatorDialog::validate_session(RelocatorConfig& session) {
    session = config_;
    session.source_roots = current_sources();
    session.destination_root = destination_edit_->text().trimmed();

    IssueList issues;
    if (!session.validate(issues)) {
        show_issues("Configuration problem", issues);
        return false;
    }
    return true;
}

void RelocatorDialog::on_analyze() {
    if (busy_) {
        return;
    }
    RelocatorConfig session;
    if (!validate_session(session)) {
        return;
    }

    model_->clear();
    apply_btn_->setEnabled(false);
    progress_bar_->setValue(0);
    status_label_->setText("Analyzing...");
    set_busy(true);

    emit analyze_requested(session.source_roots, session.destination_root);
}

void RelocatorDialog::on_apply() {
    if (busy_ || !tree_.has_selection()) {
        return;
    }
    RelocatorConfig session;
    if (!validate_session(session)) {
        return;
    }

    const MediaItemList selected = tree_.selected_items();
    const auto answer = QMessageBox::question(this, "Move files",
        QString("Move %1 file(s) into %2?\nEmpty source folders will be removed afterwards.")
            .arg(selected.size()).arg(session.destination_root));
    if (answer != QMessageBox::Yes) {
        return;
    }

    batch_sources_ = session.source_roots;
    progress_bar_->setValue(0);
    status_label_->setText("Moving...");
    set_busy(true);

    emit apply_requested(selected, batch_sources_);
}

void RelocatorDialog::set_busy(bool busy) {
    busy_ = busy;
    analyze_btn_->setEnabled(!busy);
    apply_btn_->setEnabled(!busy && tree_.has_selection());
    source_list_->setEnabled(!busy);
    destination_edit_->setEnabled(!busy);
    plan_view_->setEnabled(!busy);
}

void RelocatorDialog::on_guessers_checked(const QStringList& available, const QStringList& missing) {
    if (missing.isEmpty() && !available.isEmpty()) {
        guesser_banner_->setText(QString("Title guessers available: %1").arg(available.join(", ")));
        guesser_banner_->setStyleSheet(QString("padding: 8px 12px; background-color: %1; border: 1px solid %2; color: %3;")
            .arg(ui::colors::kOkBg).arg(ui::colors::kOkBorder).arg(ui::colors::kOkText));
        return;
    }

    QString text = available.isEmpty()
        ? QString("No optional title guessers available.")
        : QString("Title guessers available: %1.").arg(available.join(", "));
    if (!missing.isEmpty()) {
        text += QString(" Not found: %1. Only file name rules will be used for those.").arg(missing.join(", "));
    }
    guesser_banner_->setText(text);
    guesser_banner_->setStyleSheet(QString("padding: 8px 12px; background-color: %1; border: 1px solid %2; color: %3;")
        .arg(ui::colors::kWarningBg).arg(ui::colors::kWarningBorder).arg(ui::colors::kWarningText));
}

void RelocatorDialog::on_analysis_finished(const MediaItemList& items, const IssueList& warnings) {
    model_->set_items(items);
    plan_view_->expandToDepth(0);
    set_busy(false);

    qint64 total = 0;
    for (const MediaItem& item : items) {
        total += item.source_size;
    }
    status_label_->setText(QString("%1 file(s) planned, %2").arg(items.size()).arg(naming::format_bytes(total)));

    if (!warnings.empty()) {
        show_issues("Analysis warnings", warnings);
    }
}

void RelocatorDialog::on_progress(qint64 bytes_done, qint64 bytes_total, const QString& label) {
    const double fraction = bytes_total > 0 ? static_cast<double>(bytes_done) / bytes_total : 1.0;
    progress_bar_->setValue(static_cast<int>(fraction * kProgressRange));

    status_label_->setText(QString("Moving: %1 | %2 / %3 (%4%)")
        .arg(label.isEmpty() ? QString("...") : label)
        .arg(naming::format_bytes(bytes_done))
        .arg(naming::format_bytes(bytes_total))
        .arg(fraction * 100.0, 0, 'f', 1));
}

void RelocatorDialog::on_apply_finished(int files_moved, qint64 bytes_moved, const IssueList& issues) {
    model_->clear();
    progress_bar_->setValue(kProgressRange);
    set_busy(false);

    status_label_->setText(QString("Moved %1 file(s), %2. %3 problem(s).")
        .arg(files_moved).arg(naming::format_bytes(bytes_moved)).arg(issues.size()));
    LOG_INFO("Dialog", status_label_->text());

    if (!issues.empty()) {
        show_issues("Move finished with problems", issues);
    } else {
        QMessageBox::information(this, "Move finished",
            QString("Moved %1 file(s) into the library.").arg(files_moved));
    }
}

void RelocatorDialog::on_selection_changed(int selected_count) {
    apply_btn_->setEnabled(!busy_ && selected_count > 0);
    apply_btn_->setText(selected_count > 0 ? QString("Move selected (%1)").arg(selected_count)
                                           : QString("Move selected"));
}

void RelocatorDialog::show_issues(const QString& title, const IssueList& issues) {
    const QStringList lines = describe_issues(issues);

    QMessageBox box(this);
    box.setIcon(QMessageBox::Warning);
    box.setWindowTitle(title);
    box.setText(QString("%1 problem(s) were reported.").arg(issues.size()));
    box.setDetailedText(lines.join('\n'));
    box.exec();
}
