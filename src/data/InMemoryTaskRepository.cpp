#include "tasklist/data/InMemoryTaskRepository.hpp"

namespace tasklist {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::optional<std::vector<TaskItem>> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    return tasks;
}

std::optional<qint64> InMemoryTaskRepository::addTask(const QString &title, const std::optional<QString> &description)
{
    TaskItem task;
    task.id = m_nextId++;
    task.title = title;
    task.description = description;
    m_items.insert(task.id, task);
    return task.id;
}

bool InMemoryTaskRepository::updateTask(qint64 id, const QString &title, const std::optional<QString> &description)
{
    auto it = m_items.find(id);
    if (it != m_items.end()) {
        it->title = title;
        it->description = description;
    }
    return true;
}

bool InMemoryTaskRepository::toggleDone(qint64 id)
{
    auto it = m_items.find(id);
    if (it != m_items.end()) {
        it->done = !it->done;
    }
    return true;
}

bool InMemoryTaskRepository::setDeleted(qint64 id, bool deleted)
{
    auto it = m_items.find(id);
    if (it != m_items.end()) {
        it->deleted = deleted;
    }
    return true;
}

QString InMemoryTaskRepository::lastError() const
{
    return {};
}

} // namespace data
} // namespace tasklist
