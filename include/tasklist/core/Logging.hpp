#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appSql)
Q_DECLARE_LOGGING_CATEGORY(appUi)

namespace tasklist {
namespace core {

// Installs the message pattern and handler. Messages always go to stderr;
// a non-empty filePath additionally appends them to that file.
void initLogging(const QString &filePath = QString());

} // namespace core
} // namespace tasklist
