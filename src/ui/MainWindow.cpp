#include "tasklist/ui/MainWindow.hpp"

#include <QAbstractButton>
#include <QAbstractItemView>
#include <QAction>
#include <QButtonGroup>
#include <QFontMetrics>
#include <QFrame>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QKeySequence>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QShortcut>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QToolButton>
#include <QVBoxLayout>
#include <QWidget>

#include "tasklist/core/AppContext.hpp"
#include "tasklist/core/AppSettings.hpp"
#include "tasklist/core/Logging.hpp"
#include "tasklist/core/TaskStore.hpp"
#include "tasklist/ui/models/TaskFilterProxyModel.hpp"
#include "tasklist/ui/models/TaskListModel.hpp"
#include "tasklist/ui/viewmodels/TaskListViewModel.hpp"
#include "tasklist/ui/widgets/TaskInlineEditor.hpp"
#include "tasklist/ui/widgets/TaskItemDelegate.hpp"

namespace tasklist {
namespace ui {

namespace {

QFrame *createSeparator(QWidget *parent)
{
    auto *line = new QFrame(parent);
    line->setFrameShape(QFrame::HLine);
    line->setFrameShadow(QFrame::Sunken);
    return line;
}

} // namespace

MainWindow::MainWindow(core::AppContext &context, QWidget *parent)
    : QMainWindow(parent)
    , m_context(context)
    , m_viewModel(std::make_unique<TaskListViewModel>(context.taskStore()))
{
    m_viewModel->setFilter(core::settings::lastFilter());
    setupUi();

    connect(m_viewModel.get(), &TaskListViewModel::tasksChanged, this, &MainWindow::handleTasksChanged);
    connect(m_viewModel.get(), &TaskListViewModel::editStateChanged, this, &MainWindow::handleEditStateChanged);
    connect(m_viewModel.get(), &TaskListViewModel::errorOccurred, this, &MainWindow::showError);
    connect(m_viewModel.get(), &TaskListViewModel::filterChanged, this, [this](core::TaskFilter filter) {
        syncFilterButtons(filter);
        core::settings::setLastFilter(filter);
        updateActionButtons();
    });
    connect(m_viewModel.get(), &TaskListViewModel::newTaskFormCleared, this, [this]() {
        const QSignalBlocker titleBlocker(m_titleField);
        const QSignalBlocker descriptionBlocker(m_descriptionField);
        m_titleField->clear();
        m_descriptionField->clear();
        m_titleField->setFocus(Qt::OtherFocusReason);
    });

    const QByteArray geometry = core::settings::windowGeometry();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
    handleTasksChanged();
}

MainWindow::~MainWindow()
{
    core::settings::setWindowGeometry(saveGeometry());
}

void MainWindow::setupUi()
{
    resize(640, 720);

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(8);

    auto *title = new QLabel(tr("Task List"), centralWidget);
    title->setObjectName(QStringLiteral("taskListTitle"));
    QFont titleFont = title->font();
    titleFont.setBold(true);
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.4);
    title->setFont(titleFont);
    layout->addWidget(title);

    layout->addWidget(createEntryPanel());
    layout->addWidget(createSeparator(centralWidget));
    layout->addWidget(createFilterBar());
    layout->addWidget(createSeparator(centralWidget));
    layout->addWidget(createTaskPanel(), 1);

    setCentralWidget(centralWidget);
    setupShortcuts();

    if (statusBar()) {
        m_countLabel = new QLabel(this);
        statusBar()->addPermanentWidget(m_countLabel);
        statusBar()->showMessage(tr("Ready"), 2000);
    }
}

QWidget *MainWindow::createEntryPanel()
{
    auto *panel = new QWidget(this);
    auto *layout = new QHBoxLayout(panel);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    m_titleField = new QLineEdit(panel);
    m_titleField->setPlaceholderText(tr("Title"));
    connect(m_titleField, &QLineEdit::textChanged, m_viewModel.get(), &TaskListViewModel::setNewTitle);
    connect(m_titleField, &QLineEdit::returnPressed, this, &MainWindow::addTask);

    m_descriptionField = new QPlainTextEdit(panel);
    m_descriptionField->setPlaceholderText(tr("Description (optional)"));
    m_descriptionField->setTabChangesFocus(true);
    const QFontMetrics metrics(m_descriptionField->font());
    m_descriptionField->setFixedHeight(metrics.lineSpacing() * 2 + 8);
    connect(m_descriptionField, &QPlainTextEdit::textChanged, this, [this]() {
        m_viewModel->setNewDescription(m_descriptionField->toPlainText());
    });

    m_addButton = new QPushButton(tr("Add"), panel);
    connect(m_addButton, &QPushButton::clicked, this, &MainWindow::addTask);

    layout->addWidget(m_titleField, 2);
    layout->addWidget(m_descriptionField, 3);
    layout->addWidget(m_addButton);
    return panel;
}

QWidget *MainWindow::createFilterBar()
{
    auto *bar = new QWidget(this);
    auto *layout = new QHBoxLayout(bar);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    m_filterGroup = new QButtonGroup(bar);
    m_filterGroup->setExclusive(true);

    auto addFilterButton = [this, bar, layout](const QString &label, core::TaskFilter filter, Qt::Key key) {
        auto *button = new QToolButton(bar);
        button->setText(label);
        button->setCheckable(true);
        button->setAutoRaise(true);
        button->setToolTip(tr("%1 (%2)").arg(label, QKeySequence(Qt::CTRL | key).toString(QKeySequence::NativeText)));
        m_filterGroup->addButton(button, static_cast<int>(filter));
        layout->addWidget(button);

        auto *shortcut = new QShortcut(QKeySequence(Qt::CTRL | key), this);
        connect(shortcut, &QShortcut::activated, this, [this, filter]() {
            m_viewModel->apply({ UserAction::Kind::ChangeFilter, 0, filter });
        });
    };

    addFilterButton(tr("All"), core::TaskFilter::All, Qt::Key_1);
    addFilterButton(tr("Active"), core::TaskFilter::Active, Qt::Key_2);
    addFilterButton(tr("Completed"), core::TaskFilter::Completed, Qt::Key_3);
    addFilterButton(tr("Deleted"), core::TaskFilter::Deleted, Qt::Key_4);
    layout->addStretch(1);

    connect(m_filterGroup, &QButtonGroup::idClicked, this, &MainWindow::handleFilterSelected);
    syncFilterButtons(m_viewModel->filter());
    return bar;
}

QWidget *MainWindow::createTaskPanel()
{
    auto *panel = new QWidget(this);
    auto *layout = new QVBoxLayout(panel);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    m_taskView = new QListView(panel);
    m_taskView->setObjectName(QStringLiteral("taskList"));
    m_taskView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_taskView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_taskView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_taskView->setItemDelegate(new TaskItemDelegate(m_taskView));
    m_taskView->setAlternatingRowColors(true);
    m_taskView->setModel(m_viewModel->proxyModel());
    connect(m_taskView->selectionModel(),
            &QItemSelectionModel::selectionChanged,
            this,
            [this](const QItemSelection &, const QItemSelection &) { updateActionButtons(); });
    connect(m_taskView, &QListView::doubleClicked, this, &MainWindow::handleTaskDoubleClicked);
    // Every mutation resets the source model; carry the selection across it.
    connect(m_viewModel->model(), &QAbstractItemModel::modelAboutToBeReset, this, [this]() {
        const auto task = selectedTask();
        m_pendingSelection = task.has_value() ? std::optional<qint64>(task->id) : std::nullopt;
    });
    connect(m_viewModel->model(), &QAbstractItemModel::modelReset, this, &MainWindow::restoreSelection);
    layout->addWidget(m_taskView, 1);

    auto *actionLayout = new QHBoxLayout();
    actionLayout->setSpacing(6);
    m_editButton = new QPushButton(tr("Edit"), panel);
    m_editButton->setObjectName(QStringLiteral("editButton"));
    m_deleteButton = new QPushButton(tr("Delete"), panel);
    m_deleteButton->setObjectName(QStringLiteral("deleteButton"));
    m_restoreButton = new QPushButton(tr("Restore"), panel);
    m_restoreButton->setObjectName(QStringLiteral("restoreButton"));
    connect(m_editButton, &QPushButton::clicked, this, &MainWindow::editSelectedTask);
    connect(m_deleteButton, &QPushButton::clicked, this, &MainWindow::deleteSelectedTask);
    connect(m_restoreButton, &QPushButton::clicked, this, &MainWindow::restoreSelectedTask);
    actionLayout->addStretch(1);
    actionLayout->addWidget(m_editButton);
    actionLayout->addWidget(m_deleteButton);
    actionLayout->addWidget(m_restoreButton);
    layout->addLayout(actionLayout);

    m_editor = new TaskInlineEditor(panel);
    connect(m_editor, &TaskInlineEditor::titleEdited, m_viewModel.get(), &TaskListViewModel::setEditTitle);
    connect(m_editor, &TaskInlineEditor::descriptionEdited, m_viewModel.get(), &TaskListViewModel::setEditDescription);
    connect(m_editor, &TaskInlineEditor::saveRequested, this, [this]() {
        const auto id = m_viewModel->editingTaskId();
        if (id.has_value()) {
            m_viewModel->apply({ UserAction::Kind::SaveEdit, *id, m_viewModel->filter() });
        }
    });
    connect(m_editor, &TaskInlineEditor::cancelRequested, this, [this]() {
        const auto id = m_viewModel->editingTaskId();
        if (id.has_value()) {
            m_viewModel->apply({ UserAction::Kind::CancelEdit, *id, m_viewModel->filter() });
        }
    });
    layout->addWidget(m_editor);

    return panel;
}

void MainWindow::setupShortcuts()
{
    auto *newTaskShortcut = new QShortcut(QKeySequence::New, this);
    connect(newTaskShortcut, &QShortcut::activated, this, [this]() {
        m_titleField->setFocus(Qt::ShortcutFocusReason);
        m_titleField->selectAll();
    });

    auto *deleteAction = new QAction(tr("Delete task"), m_taskView);
    deleteAction->setShortcut(QKeySequence::Delete);
    deleteAction->setShortcutContext(Qt::WidgetShortcut);
    m_taskView->addAction(deleteAction);
    connect(deleteAction, &QAction::triggered, this, &MainWindow::deleteSelectedTask);

    auto *editAction = new QAction(tr("Edit task"), m_taskView);
    editAction->setShortcut(QKeySequence(Qt::Key_E));
    editAction->setShortcutContext(Qt::WidgetShortcut);
    m_taskView->addAction(editAction);
    connect(editAction, &QAction::triggered, this, &MainWindow::editSelectedTask);

    auto *toggleAction = new QAction(tr("Toggle done"), m_taskView);
    toggleAction->setShortcut(QKeySequence(Qt::Key_Space));
    toggleAction->setShortcutContext(Qt::WidgetShortcut);
    m_taskView->addAction(toggleAction);
    connect(toggleAction, &QAction::triggered, this, &MainWindow::toggleSelectedTask);

    auto *restoreAction = new QAction(tr("Restore task"), m_taskView);
    restoreAction->setShortcut(QKeySequence(Qt::Key_R));
    restoreAction->setShortcutContext(Qt::WidgetShortcut);
    m_taskView->addAction(restoreAction);
    connect(restoreAction, &QAction::triggered, this, &MainWindow::restoreSelectedTask);

    m_taskView->setContextMenuPolicy(Qt::ActionsContextMenu);
}

void MainWindow::addTask()
{
    if (m_viewModel->apply({ UserAction::Kind::Add, 0, m_viewModel->filter() })) {
        statusBar()->showMessage(tr("Task added"), 1500);
    }
}

void MainWindow::handleFilterSelected(int id)
{
    m_viewModel->apply({ UserAction::Kind::ChangeFilter, 0, static_cast<core::TaskFilter>(id) });
}

void MainWindow::syncFilterButtons(core::TaskFilter filter)
{
    if (!m_filterGroup) {
        return;
    }
    if (auto *button = m_filterGroup->button(static_cast<int>(filter))) {
        const QSignalBlocker blocker(m_filterGroup);
        button->setChecked(true);
    }
}

void MainWindow::editSelectedTask()
{
    const auto task = selectedTask();
    if (!task.has_value()) {
        return;
    }
    m_viewModel->apply({ UserAction::Kind::StartEdit, task->id, m_viewModel->filter() });
}

void MainWindow::deleteSelectedTask()
{
    const auto task = selectedTask();
    if (!task.has_value()) {
        return;
    }
    if (m_viewModel->apply({ UserAction::Kind::Delete, task->id, m_viewModel->filter() })) {
        statusBar()->showMessage(tr("Task deleted: %1").arg(task->title), 1500);
    }
}

void MainWindow::restoreSelectedTask()
{
    const auto task = selectedTask();
    if (!task.has_value()) {
        return;
    }
    if (m_viewModel->apply({ UserAction::Kind::Restore, task->id, m_viewModel->filter() })) {
        statusBar()->showMessage(tr("Task restored: %1").arg(task->title), 1500);
    }
}

void MainWindow::toggleSelectedTask()
{
    const auto task = selectedTask();
    if (!task.has_value()) {
        return;
    }
    m_viewModel->apply({ UserAction::Kind::ToggleDone, task->id, m_viewModel->filter() });
}

void MainWindow::handleTaskDoubleClicked(const QModelIndex &index)
{
    const auto sourceIndex = m_viewModel->proxyModel()->mapToSource(index);
    const auto *task = m_viewModel->model()->taskAt(sourceIndex);
    if (!task) {
        return;
    }
    m_viewModel->apply({ UserAction::Kind::StartEdit, task->id, m_viewModel->filter() });
}

void MainWindow::handleEditStateChanged()
{
    if (!m_editor) {
        return;
    }
    const auto id = m_viewModel->editingTaskId();
    if (!id.has_value()) {
        m_editor->clearEditor();
        m_taskView->setFocus(Qt::OtherFocusReason);
        updateActionButtons();
        return;
    }
    m_editor->setTask(m_viewModel->editTitle(), m_viewModel->editDescription());
    m_editor->focusTitle(true);
    updateActionButtons();
}

void MainWindow::handleTasksChanged()
{
    if (m_countLabel) {
        const auto visible = static_cast<qulonglong>(m_viewModel->visibleTasks().size());
        const auto total = static_cast<qulonglong>(m_context.taskStore().tasks().size());
        m_countLabel->setText(tr("%1 shown / %2 total").arg(visible).arg(total));
    }
    updateActionButtons();
}

void MainWindow::updateActionButtons()
{
    if (!m_editButton || !m_deleteButton || !m_restoreButton) {
        return;
    }
    TaskActions actions;
    if (const auto task = selectedTask()) {
        actions = m_viewModel->actionsFor(*task);
    }
    m_editButton->setEnabled(actions.testFlag(TaskAction::StartEdit));
    m_deleteButton->setEnabled(actions.testFlag(TaskAction::Delete));
    m_restoreButton->setEnabled(actions.testFlag(TaskAction::Restore));
    m_restoreButton->setVisible(m_viewModel->filter() == core::TaskFilter::Deleted);
    m_deleteButton->setVisible(m_viewModel->filter() != core::TaskFilter::Deleted);
}

void MainWindow::restoreSelection()
{
    const auto id = m_pendingSelection;
    m_pendingSelection.reset();
    if (!id.has_value()) {
        return;
    }
    const QModelIndex index = m_viewModel->proxyModel()->mapFromSource(m_viewModel->model()->indexForId(*id));
    if (!index.isValid()) {
        return;
    }
    m_taskView->selectionModel()->setCurrentIndex(index, QItemSelectionModel::ClearAndSelect);
}

void MainWindow::showError(const QString &message)
{
    qCWarning(appUi) << message;
    statusBar()->showMessage(message, 5000);
}

std::optional<data::TaskItem> MainWindow::selectedTask() const
{
    if (!m_taskView || !m_taskView->selectionModel()) {
        return std::nullopt;
    }
    const auto rows = m_taskView->selectionModel()->selectedRows();
    if (rows.isEmpty()) {
        return std::nullopt;
    }
    const auto sourceIndex = m_viewModel->proxyModel()->mapToSource(rows.first());
    const auto *task = m_viewModel->model()->taskAt(sourceIndex);
    if (!task) {
        return std::nullopt;
    }
    return *task;
}

} // namespace ui
} // namespace tasklist
