#include "tasklist/ui/viewmodels/TaskListViewModel.hpp"

#include <QVector>

#include "tasklist/core/Logging.hpp"
#include "tasklist/ui/models/TaskFilterProxyModel.hpp"
#include "tasklist/ui/models/TaskListModel.hpp"

namespace tasklist {
namespace ui {

TaskListViewModel::TaskListViewModel(core::TaskStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_model(std::make_unique<TaskListModel>(this))
    , m_proxyModel(std::make_unique<TaskFilterProxyModel>(this))
{
    m_proxyModel->setSourceModel(m_model.get());
    m_proxyModel->setTaskFilter(m_filter);
    // Queued: the request arrives from inside the view's setData call and the
    // model must not be reset before that call returns.
    connect(m_model.get(),
            &TaskListModel::toggleDoneRequested,
            this,
            &TaskListViewModel::toggleDone,
            Qt::QueuedConnection);
    syncModel();
}

TaskListViewModel::~TaskListViewModel() = default;

TaskListModel *TaskListViewModel::model() const
{
    return m_model.get();
}

TaskFilterProxyModel *TaskListViewModel::proxyModel() const
{
    return m_proxyModel.get();
}

core::TaskFilter TaskListViewModel::filter() const
{
    return m_filter;
}

std::vector<data::TaskItem> TaskListViewModel::visibleTasks() const
{
    return core::filterTasks(m_store.tasks(), m_filter);
}

std::vector<TaskRow> TaskListViewModel::visibleRows() const
{
    std::vector<TaskRow> rows;
    for (const auto &task : visibleTasks()) {
        rows.push_back({ task, actionsFor(task) });
    }
    return rows;
}

TaskActions TaskListViewModel::actionsFor(const data::TaskItem &task) const
{
    if (task.deleted) {
        return TaskAction::Restore;
    }
    if (editingTaskId() == task.id) {
        return TaskAction::ToggleDone | TaskAction::SaveEdit | TaskAction::CancelEdit;
    }
    return TaskAction::ToggleDone | TaskAction::StartEdit | TaskAction::Delete;
}

TaskActions TaskListViewModel::actionsFor(qint64 id) const
{
    const auto task = m_store.taskById(id);
    if (!task.has_value()) {
        return {};
    }
    return actionsFor(*task);
}

QString TaskListViewModel::newTitle() const
{
    return m_newTitle;
}

QString TaskListViewModel::newDescription() const
{
    return m_newDescription;
}

const EditState &TaskListViewModel::editState() const
{
    return m_editState;
}

std::optional<qint64> TaskListViewModel::editingTaskId() const
{
    if (const auto *editing = std::get_if<Editing>(&m_editState)) {
        return editing->taskId;
    }
    return std::nullopt;
}

QString TaskListViewModel::editTitle() const
{
    if (const auto *editing = std::get_if<Editing>(&m_editState)) {
        return editing->title;
    }
    return {};
}

QString TaskListViewModel::editDescription() const
{
    if (const auto *editing = std::get_if<Editing>(&m_editState)) {
        return editing->description;
    }
    return {};
}

bool TaskListViewModel::apply(const UserAction &action)
{
    switch (action.kind) {
    case UserAction::Kind::Add:
        return addTask();
    case UserAction::Kind::ToggleDone:
        return toggleDone(action.taskId);
    case UserAction::Kind::StartEdit:
        return startEdit(action.taskId);
    case UserAction::Kind::SaveEdit:
        if (editingTaskId() != action.taskId) {
            return false;
        }
        return saveEdit();
    case UserAction::Kind::CancelEdit:
        if (editingTaskId() != action.taskId) {
            return false;
        }
        return cancelEdit();
    case UserAction::Kind::Delete:
        return deleteTask(action.taskId);
    case UserAction::Kind::Restore:
        return restoreTask(action.taskId);
    case UserAction::Kind::ChangeFilter:
        if (m_filter == action.filter) {
            return false;
        }
        setFilter(action.filter);
        return true;
    }
    return false;
}

void TaskListViewModel::refresh()
{
    if (!m_store.reload()) {
        emit errorOccurred(tr("Could not load tasks: %1").arg(m_store.lastError()));
        return;
    }
    syncModel();
}

void TaskListViewModel::setFilter(core::TaskFilter filter)
{
    if (m_filter == filter) {
        return;
    }
    m_filter = filter;
    m_proxyModel->setTaskFilter(filter);
    emit filterChanged(filter);
}

void TaskListViewModel::setNewTitle(const QString &title)
{
    m_newTitle = title;
}

void TaskListViewModel::setNewDescription(const QString &description)
{
    m_newDescription = description;
}

void TaskListViewModel::setEditTitle(const QString &title)
{
    if (auto *editing = std::get_if<Editing>(&m_editState)) {
        editing->title = title;
    }
}

void TaskListViewModel::setEditDescription(const QString &description)
{
    if (auto *editing = std::get_if<Editing>(&m_editState)) {
        editing->description = description;
    }
}

bool TaskListViewModel::addTask()
{
    const auto result = m_store.addTask(m_newTitle, m_newDescription);
    if (!handleResult(result, tr("Could not add task"))) {
        return false;
    }
    m_newTitle.clear();
    m_newDescription.clear();
    emit newTaskFormCleared();
    return true;
}

bool TaskListViewModel::toggleDone(qint64 id)
{
    if (!isAvailable(id, TaskAction::ToggleDone)) {
        return false;
    }
    return handleResult(m_store.toggleDone(id), tr("Could not update task"));
}

bool TaskListViewModel::startEdit(qint64 id)
{
    if (!isAvailable(id, TaskAction::StartEdit)) {
        return false;
    }
    const auto task = m_store.taskById(id);
    if (const auto current = editingTaskId()) {
        qCDebug(appUi) << "Switching edit target from" << *current << "to" << id << ", discarding buffers";
    }
    setEditState(Editing{ id, task->title, task->description.value_or(QString()) });
    return true;
}

bool TaskListViewModel::saveEdit()
{
    const auto *editing = std::get_if<Editing>(&m_editState);
    if (!editing) {
        return false;
    }
    const Editing target = *editing;
    const auto result = m_store.updateTask(target.taskId, target.title, target.description);
    if (result == core::MutationResult::Failed) {
        // Keep the buffers so the edit can be retried.
        return handleResult(result, tr("Could not save task"));
    }
    setEditState(Viewing{});
    return handleResult(result, tr("Could not save task"));
}

bool TaskListViewModel::cancelEdit()
{
    if (!std::holds_alternative<Editing>(m_editState)) {
        return false;
    }
    setEditState(Viewing{});
    return true;
}

bool TaskListViewModel::deleteTask(qint64 id)
{
    if (!isAvailable(id, TaskAction::Delete)) {
        return false;
    }
    return handleResult(m_store.softDelete(id), tr("Could not delete task"));
}

bool TaskListViewModel::restoreTask(qint64 id)
{
    if (!isAvailable(id, TaskAction::Restore)) {
        return false;
    }
    return handleResult(m_store.restore(id), tr("Could not restore task"));
}

bool TaskListViewModel::isAvailable(qint64 id, TaskAction action) const
{
    return actionsFor(id).testFlag(action);
}

bool TaskListViewModel::handleResult(core::MutationResult result, const QString &failureMessage)
{
    switch (result) {
    case core::MutationResult::Applied:
        syncModel();
        return true;
    case core::MutationResult::Rejected:
        return false;
    case core::MutationResult::Failed:
        emit errorOccurred(QStringLiteral("%1: %2").arg(failureMessage, m_store.lastError()));
        return false;
    }
    return false;
}

void TaskListViewModel::syncModel()
{
    const auto &tasks = m_store.tasks();
    QVector<data::TaskItem> items;
    items.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        items.append(task);
    }
    m_model->setTasks(std::move(items));

    if (const auto id = editingTaskId()) {
        const auto task = m_store.taskById(*id);
        if (!task.has_value() || task->deleted) {
            setEditState(Viewing{});
        }
    }
    emit tasksChanged();
}

void TaskListViewModel::setEditState(EditState state)
{
    m_editState = std::move(state);
    emit editStateChanged();
}

} // namespace ui
} // namespace tasklist
