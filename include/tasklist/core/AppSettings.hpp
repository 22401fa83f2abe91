#pragma once

#include <QByteArray>
#include <QString>

#include "tasklist/core/TaskFilter.hpp"

namespace tasklist {
namespace core {

// QSettings backed configuration. Organization and application name must be
// set on QCoreApplication before these are used.
namespace settings {

QString defaultDatabasePath();
QString databasePath();

QString logFilePath();

TaskFilter lastFilter();
void setLastFilter(TaskFilter filter);

QByteArray windowGeometry();
void setWindowGeometry(const QByteArray &geometry);

} // namespace settings
} // namespace core
} // namespace tasklist
