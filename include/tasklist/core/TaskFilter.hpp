#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace core {

enum class TaskFilter
{
    All,
    Active,
    Completed,
    Deleted,
};

// All hides soft-deleted tasks; only Deleted shows them.
bool matchesFilter(const data::TaskItem &task, TaskFilter filter);
std::vector<data::TaskItem> filterTasks(const std::vector<data::TaskItem> &tasks, TaskFilter filter);

QString filterToString(TaskFilter filter);
std::optional<TaskFilter> filterFromString(const QString &value);

} // namespace core
} // namespace tasklist
