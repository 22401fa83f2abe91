#include "tasklist/core/TaskFilter.hpp"

#include <algorithm>
#include <iterator>

namespace tasklist {
namespace core {

bool matchesFilter(const data::TaskItem &task, TaskFilter filter)
{
    switch (filter) {
    case TaskFilter::All:
        return !task.deleted;
    case TaskFilter::Active:
        return !task.done && !task.deleted;
    case TaskFilter::Completed:
        return task.done && !task.deleted;
    case TaskFilter::Deleted:
        return task.deleted;
    }
    return false;
}

std::vector<data::TaskItem> filterTasks(const std::vector<data::TaskItem> &tasks, TaskFilter filter)
{
    std::vector<data::TaskItem> result;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(result), [filter](const data::TaskItem &task) {
        return matchesFilter(task, filter);
    });
    return result;
}

QString filterToString(TaskFilter filter)
{
    switch (filter) {
    case TaskFilter::All:
        return QStringLiteral("all");
    case TaskFilter::Active:
        return QStringLiteral("active");
    case TaskFilter::Completed:
        return QStringLiteral("completed");
    case TaskFilter::Deleted:
        return QStringLiteral("deleted");
    }
    return QStringLiteral("all");
}

std::optional<TaskFilter> filterFromString(const QString &value)
{
    const QString key = value.trimmed().toLower();
    if (key == QLatin1String("all")) {
        return TaskFilter::All;
    }
    if (key == QLatin1String("active")) {
        return TaskFilter::Active;
    }
    if (key == QLatin1String("completed")) {
        return TaskFilter::Completed;
    }
    if (key == QLatin1String("deleted")) {
        return TaskFilter::Deleted;
    }
    return std::nullopt;
}

} // namespace core
} // namespace tasklist
