#pragma once

#include <memory>
#include <QString>

namespace tasklist {
namespace data {

class TaskRepository;
class SqlTaskRepository;

class DataProvider
{
public:
    DataProvider();
    ~DataProvider();

    bool initialize(const QString &databasePath);
    QString lastError() const;

    TaskRepository &taskRepository();

private:
    std::unique_ptr<SqlTaskRepository> m_taskRepository;
    QString m_lastError;
};

} // namespace data
} // namespace tasklist
