#include "tasklist/data/DataProvider.hpp"

#include <QDir>
#include <QFileInfo>
#include <QObject>

#include "tasklist/core/Logging.hpp"
#include "tasklist/data/SqlTaskRepository.hpp"

namespace tasklist {
namespace data {

DataProvider::DataProvider()
    : m_taskRepository(std::make_unique<SqlTaskRepository>())
{
}

DataProvider::~DataProvider() = default;

bool DataProvider::initialize(const QString &databasePath)
{
    if (databasePath != QLatin1String(":memory:")) {
        const QDir dir = QFileInfo(databasePath).absoluteDir();
        if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
            m_lastError = QObject::tr("Cannot create storage folder %1").arg(dir.absolutePath());
            qCCritical(appSql) << m_lastError;
            return false;
        }
    }

    if (!m_taskRepository->open(databasePath)) {
        m_lastError = m_taskRepository->lastError();
        return false;
    }
    m_lastError.clear();
    return true;
}

QString DataProvider::lastError() const
{
    return m_lastError;
}

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

} // namespace data
} // namespace tasklist
