#include "tasklist/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace tasklist {
namespace core {
namespace settings {

namespace {

constexpr auto kDatabasePathKey = "storage/databasePath";
constexpr auto kLogFilePathKey = "logging/filePath";
constexpr auto kFilterKey = "ui/filter";
constexpr auto kGeometryKey = "ui/geometry";
constexpr auto kDatabaseFileName = "tasks.db";

} // namespace

QString defaultDatabasePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/tasklist");
    }
    return QDir(storageFolder).filePath(QString::fromLatin1(kDatabaseFileName));
}

QString databasePath()
{
    QSettings settings;
    const QString stored = settings.value(QString::fromLatin1(kDatabasePathKey)).toString().trimmed();
    if (stored.isEmpty()) {
        return defaultDatabasePath();
    }
    return stored;
}

QString logFilePath()
{
    QSettings settings;
    return settings.value(QString::fromLatin1(kLogFilePathKey)).toString().trimmed();
}

TaskFilter lastFilter()
{
    QSettings settings;
    const QString stored = settings.value(QString::fromLatin1(kFilterKey)).toString();
    return filterFromString(stored).value_or(TaskFilter::All);
}

void setLastFilter(TaskFilter filter)
{
    QSettings settings;
    settings.setValue(QString::fromLatin1(kFilterKey), filterToString(filter));
}

QByteArray windowGeometry()
{
    QSettings settings;
    return settings.value(QString::fromLatin1(kGeometryKey)).toByteArray();
}

void setWindowGeometry(const QByteArray &geometry)
{
    QSettings settings;
    settings.setValue(QString::fromLatin1(kGeometryKey), geometry);
}

} // namespace settings
} // namespace core
} // namespace tasklist
