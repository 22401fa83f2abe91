#include "tasklist/ui/models/TaskListModel.hpp"

#include <QColor>

namespace tasklist {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_tasks.size());
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    const auto *task = taskAt(index);
    if (!task) {
        return {};
    }

    switch (role) {
    case Qt::DisplayRole:
        return task->title;
    case Qt::ToolTipRole:
        if (task->description.has_value()) {
            return *task->description;
        }
        return {};
    case Qt::CheckStateRole:
        return task->done ? Qt::Checked : Qt::Unchecked;
    case Qt::ForegroundRole:
        if (task->done || task->deleted) {
            return QColor(130, 130, 130);
        }
        return {};
    case TaskIdRole:
        return task->id;
    case DescriptionRole:
        return task->description.value_or(QString());
    case DoneRole:
        return task->done;
    case DeletedRole:
        return task->deleted;
    default:
        return {};
    }
}

bool TaskListModel::setData(const QModelIndex &index, const QVariant &value, int role)
{
    Q_UNUSED(value);
    const auto *task = taskAt(index);
    if (!task || role != Qt::CheckStateRole || task->deleted) {
        return false;
    }
    emit toggleDoneRequested(task->id);
    return true;
}

Qt::ItemFlags TaskListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    const auto *task = taskAt(index);
    if (!task) {
        return defaultFlags;
    }
    defaultFlags |= Qt::ItemIsSelectable | Qt::ItemIsEnabled;
    if (!task->deleted) {
        defaultFlags |= Qt::ItemIsUserCheckable;
    }
    return defaultFlags;
}

QHash<int, QByteArray> TaskListModel::roleNames() const
{
    auto names = QAbstractListModel::roleNames();
    names.insert(TaskIdRole, "taskId");
    names.insert(DescriptionRole, "description");
    names.insert(DoneRole, "done");
    names.insert(DeletedRole, "deleted");
    return names;
}

void TaskListModel::setTasks(QVector<data::TaskItem> tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

const data::TaskItem *TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return nullptr;
    }
    return &m_tasks.at(index.row());
}

QModelIndex TaskListModel::indexForId(qint64 id) const
{
    for (int row = 0; row < m_tasks.size(); ++row) {
        if (m_tasks.at(row).id == id) {
            return index(row, 0);
        }
    }
    return {};
}

} // namespace ui
} // namespace tasklist
