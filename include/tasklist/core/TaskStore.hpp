#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace data {
class TaskRepository;
}

namespace core {

enum class MutationResult
{
    Applied,
    Rejected,
    Failed,
};

// Validates and normalizes task input, forwards it to the repository and
// keeps a full snapshot of all rows. Every successful mutation replaces the
// snapshot; a failed one leaves it untouched.
class TaskStore
{
public:
    explicit TaskStore(data::TaskRepository &repository);
    ~TaskStore();

    bool reload();
    const std::vector<data::TaskItem> &tasks() const;
    std::optional<data::TaskItem> taskById(qint64 id) const;

    MutationResult addTask(const QString &title, const QString &description);
    MutationResult updateTask(qint64 id, const QString &title, const QString &description);
    MutationResult toggleDone(qint64 id);
    MutationResult softDelete(qint64 id);
    MutationResult restore(qint64 id);

    QString lastError() const;

private:
    MutationResult finishMutation(bool ok, const char *operation);

    data::TaskRepository &m_repository;
    std::vector<data::TaskItem> m_tasks;
    QString m_lastError;
};

QString normalizedTitle(const QString &title);
std::optional<QString> normalizedDescription(const QString &description);

} // namespace core
} // namespace tasklist
