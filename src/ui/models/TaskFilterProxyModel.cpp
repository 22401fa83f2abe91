#include "tasklist/ui/models/TaskFilterProxyModel.hpp"

#include "tasklist/ui/models/TaskListModel.hpp"

namespace tasklist {
namespace ui {

TaskFilterProxyModel::TaskFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
}

void TaskFilterProxyModel::setTaskFilter(core::TaskFilter filter)
{
    if (m_filter == filter) {
        return;
    }
    m_filter = filter;
    invalidateFilter();
}

core::TaskFilter TaskFilterProxyModel::taskFilter() const
{
    return m_filter;
}

bool TaskFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    auto *taskModel = qobject_cast<TaskListModel *>(sourceModel());
    if (!taskModel) {
        return true;
    }
    const auto *task = taskModel->taskAt(taskModel->index(sourceRow, 0, sourceParent));
    if (!task) {
        return false;
    }
    return core::matchesFilter(*task, m_filter);
}

} // namespace ui
} // namespace tasklist
