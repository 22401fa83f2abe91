#pragma once

#include <QSqlDatabase>
#include <QString>

#include "tasklist/data/TaskRepository.hpp"

namespace tasklist {
namespace data {

// SQLite backed repository. Owns one named connection for its whole lifetime;
// the connection is closed and unregistered on destruction.
class SqlTaskRepository : public TaskRepository
{
public:
    SqlTaskRepository();
    ~SqlTaskRepository() override;

    SqlTaskRepository(const SqlTaskRepository &) = delete;
    SqlTaskRepository &operator=(const SqlTaskRepository &) = delete;

    // Opens (or creates) the database file and ensures the tasks schema.
    // ":memory:" opens a private in-memory database.
    bool open(const QString &databasePath);
    bool isOpen() const;

    std::optional<std::vector<TaskItem>> fetchTasks() const override;
    std::optional<qint64> addTask(const QString &title, const std::optional<QString> &description) override;
    bool updateTask(qint64 id, const QString &title, const std::optional<QString> &description) override;
    bool toggleDone(qint64 id) override;
    bool setDeleted(qint64 id, bool deleted) override;
    QString lastError() const override;

private:
    bool ensureSchema();
    bool checkOpen(const char *operation) const;

    QString m_connectionName;
    QSqlDatabase m_db;
    mutable QString m_lastError;
};

} // namespace data
} // namespace tasklist
