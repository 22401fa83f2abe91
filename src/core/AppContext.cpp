#include "tasklist/core/AppContext.hpp"

#include "tasklist/core/Logging.hpp"
#include "tasklist/core/TaskStore.hpp"
#include "tasklist/data/DataProvider.hpp"

namespace tasklist {
namespace core {

AppContext::AppContext()
    : m_dataProvider(std::make_unique<data::DataProvider>())
{
}

AppContext::~AppContext() = default;

bool AppContext::initialize(const QString &databasePath)
{
    if (!m_dataProvider->initialize(databasePath)) {
        m_lastError = m_dataProvider->lastError();
        return false;
    }

    m_taskStore = std::make_unique<TaskStore>(m_dataProvider->taskRepository());
    if (!m_taskStore->reload()) {
        m_lastError = m_taskStore->lastError();
        m_taskStore.reset();
        return false;
    }

    qCInfo(appCore) << "Loaded" << m_taskStore->tasks().size() << "tasks from" << databasePath;
    return true;
}

QString AppContext::lastError() const
{
    return m_lastError;
}

TaskStore &AppContext::taskStore()
{
    return *m_taskStore;
}

} // namespace core
} // namespace tasklist
