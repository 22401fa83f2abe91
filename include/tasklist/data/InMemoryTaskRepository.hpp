#pragma once

#include <QMap>

#include "tasklist/data/TaskRepository.hpp"

namespace tasklist {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::optional<std::vector<TaskItem>> fetchTasks() const override;
    std::optional<qint64> addTask(const QString &title, const std::optional<QString> &description) override;
    bool updateTask(qint64 id, const QString &title, const std::optional<QString> &description) override;
    bool toggleDone(qint64 id) override;
    bool setDeleted(qint64 id, bool deleted) override;
    QString lastError() const override;

private:
    QMap<qint64, TaskItem> m_items;
    qint64 m_nextId = 1;
};

} // namespace data
} // namespace tasklist
