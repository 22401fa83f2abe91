#pragma once

#include <optional>
#include <vector>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace data {

// Mutators return false only when the storage layer fails. Touching an id
// that does not exist is not a failure.
class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::optional<std::vector<TaskItem>> fetchTasks() const = 0;
    virtual std::optional<qint64> addTask(const QString &title, const std::optional<QString> &description) = 0;
    virtual bool updateTask(qint64 id, const QString &title, const std::optional<QString> &description) = 0;
    virtual bool toggleDone(qint64 id) = 0;
    virtual bool setDeleted(qint64 id, bool deleted) = 0;
    virtual QString lastError() const = 0;
};

} // namespace data
} // namespace tasklist
