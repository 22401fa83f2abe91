#pragma once

#include <QString>
#include <memory>

namespace tasklist {
namespace data {
class DataProvider;
}

namespace core {

class TaskStore;

class AppContext
{
public:
    AppContext();
    ~AppContext();

    // Opens the database and loads the first snapshot. A false return is a
    // startup failure; lastError() describes it.
    bool initialize(const QString &databasePath);
    QString lastError() const;

    TaskStore &taskStore();

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<TaskStore> m_taskStore;
    QString m_lastError;
};

} // namespace core
} // namespace tasklist
