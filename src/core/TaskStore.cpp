#include "tasklist/core/TaskStore.hpp"

#include <algorithm>

#include "tasklist/core/Logging.hpp"
#include "tasklist/data/TaskRepository.hpp"

namespace tasklist {
namespace core {

QString normalizedTitle(const QString &title)
{
    return title.trimmed();
}

std::optional<QString> normalizedDescription(const QString &description)
{
    const QString trimmed = description.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    return trimmed;
}

TaskStore::TaskStore(data::TaskRepository &repository)
    : m_repository(repository)
{
}

TaskStore::~TaskStore() = default;

bool TaskStore::reload()
{
    auto tasks = m_repository.fetchTasks();
    if (!tasks.has_value()) {
        m_lastError = m_repository.lastError();
        qCWarning(appCore) << "Reload failed, keeping previous snapshot:" << m_lastError;
        return false;
    }
    m_tasks = std::move(*tasks);
    return true;
}

const std::vector<data::TaskItem> &TaskStore::tasks() const
{
    return m_tasks;
}

std::optional<data::TaskItem> TaskStore::taskById(qint64 id) const
{
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [id](const data::TaskItem &task) {
        return task.id == id;
    });
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

MutationResult TaskStore::addTask(const QString &title, const QString &description)
{
    const QString cleanTitle = normalizedTitle(title);
    if (cleanTitle.isEmpty()) {
        qCDebug(appCore) << "addTask ignored: empty title";
        return MutationResult::Rejected;
    }
    const auto id = m_repository.addTask(cleanTitle, normalizedDescription(description));
    return finishMutation(id.has_value(), "addTask");
}

MutationResult TaskStore::updateTask(qint64 id, const QString &title, const QString &description)
{
    const QString cleanTitle = normalizedTitle(title);
    if (cleanTitle.isEmpty()) {
        qCDebug(appCore) << "updateTask ignored: empty title for id=" << id;
        return MutationResult::Rejected;
    }
    return finishMutation(m_repository.updateTask(id, cleanTitle, normalizedDescription(description)), "updateTask");
}

MutationResult TaskStore::toggleDone(qint64 id)
{
    return finishMutation(m_repository.toggleDone(id), "toggleDone");
}

MutationResult TaskStore::softDelete(qint64 id)
{
    return finishMutation(m_repository.setDeleted(id, true), "softDelete");
}

MutationResult TaskStore::restore(qint64 id)
{
    return finishMutation(m_repository.setDeleted(id, false), "restore");
}

QString TaskStore::lastError() const
{
    return m_lastError;
}

MutationResult TaskStore::finishMutation(bool ok, const char *operation)
{
    if (!ok) {
        m_lastError = m_repository.lastError();
        qCWarning(appCore) << operation << "failed:" << m_lastError;
        return MutationResult::Failed;
    }
    if (!reload()) {
        return MutationResult::Failed;
    }
    m_lastError.clear();
    return MutationResult::Applied;
}

} // namespace core
} // namespace tasklist
