#include "tasklist/core/Logging.hpp"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(appCore, "tasklist.core")
Q_LOGGING_CATEGORY(appSql, "tasklist.sql")
Q_LOGGING_CATEGORY(appUi, "tasklist.ui")

namespace tasklist {
namespace core {

namespace {

std::unique_ptr<QFile> g_logFile;
QMutex g_logMutex;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString line = qFormatLogMessage(type, context, message) + QLatin1Char('\n');
    std::fprintf(stderr, "%s", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_logMutex);
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile.get());
        stream << line;
        stream.flush();
    }
}

} // namespace

void initLogging(const QString &filePath)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));

    if (!filePath.isEmpty()) {
        auto file = std::make_unique<QFile>(filePath);
        if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            QMutexLocker lock(&g_logMutex);
            g_logFile = std::move(file);
        } else {
            qCWarning(appCore) << "Failed to open log file:" << filePath << file->errorString();
        }
    }

    qInstallMessageHandler(messageHandler);

    qCInfo(appCore) << "Logging initialized"
                    << (g_logFile ? QStringLiteral("-> %1").arg(filePath) : QStringLiteral("(stderr only)"));
}

} // namespace core
} // namespace tasklist
