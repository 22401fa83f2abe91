#pragma once

#include <QFlags>
#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "tasklist/core/TaskFilter.hpp"
#include "tasklist/core/TaskStore.hpp"
#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace ui {

class TaskListModel;
class TaskFilterProxyModel;

enum class TaskAction
{
    ToggleDone = 0x01,
    StartEdit = 0x02,
    SaveEdit = 0x04,
    CancelEdit = 0x08,
    Delete = 0x10,
    Restore = 0x20,
};
Q_DECLARE_FLAGS(TaskActions, TaskAction)

struct TaskRow
{
    data::TaskItem task;
    TaskActions actions;
};

struct Viewing
{
};

struct Editing
{
    qint64 taskId = 0;
    QString title;
    QString description;
};

using EditState = std::variant<Viewing, Editing>;

struct UserAction
{
    enum class Kind
    {
        Add,
        ToggleDone,
        StartEdit,
        SaveEdit,
        CancelEdit,
        Delete,
        Restore,
        ChangeFilter,
    };

    Kind kind = Kind::Add;
    qint64 taskId = 0;
    core::TaskFilter filter = core::TaskFilter::All;
};

class TaskListViewModel : public QObject
{
    Q_OBJECT
public:
    explicit TaskListViewModel(core::TaskStore &store, QObject *parent = nullptr);
    ~TaskListViewModel() override;

    TaskListModel *model() const;
    TaskFilterProxyModel *proxyModel() const;

    core::TaskFilter filter() const;
    std::vector<data::TaskItem> visibleTasks() const;
    std::vector<TaskRow> visibleRows() const;
    TaskActions actionsFor(const data::TaskItem &task) const;
    TaskActions actionsFor(qint64 id) const;

    QString newTitle() const;
    QString newDescription() const;

    const EditState &editState() const;
    std::optional<qint64> editingTaskId() const;
    QString editTitle() const;
    QString editDescription() const;

    // Applies one discrete user action. Returns false when the action is not
    // available for the task in its current state or did not change anything.
    bool apply(const UserAction &action);

public slots:
    void refresh();
    void setFilter(core::TaskFilter filter);
    void setNewTitle(const QString &title);
    void setNewDescription(const QString &description);
    void setEditTitle(const QString &title);
    void setEditDescription(const QString &description);
    bool addTask();
    bool toggleDone(qint64 id);
    bool startEdit(qint64 id);
    bool saveEdit();
    bool cancelEdit();
    bool deleteTask(qint64 id);
    bool restoreTask(qint64 id);

signals:
    void tasksChanged();
    void filterChanged(core::TaskFilter filter);
    void editStateChanged();
    void newTaskFormCleared();
    void errorOccurred(const QString &message);

private:
    bool isAvailable(qint64 id, TaskAction action) const;
    bool handleResult(core::MutationResult result, const QString &failureMessage);
    void syncModel();
    void setEditState(EditState state);

    core::TaskStore &m_store;
    std::unique_ptr<TaskListModel> m_model;
    std::unique_ptr<TaskFilterProxyModel> m_proxyModel;
    core::TaskFilter m_filter = core::TaskFilter::All;
    QString m_newTitle;
    QString m_newDescription;
    EditState m_editState;
};

} // namespace ui
} // namespace tasklist

Q_DECLARE_OPERATORS_FOR_FLAGS(tasklist::ui::TaskActions)
