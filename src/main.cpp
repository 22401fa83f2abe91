#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QMessageBox>
#include <QString>

#include "version.h"

#include "tasklist/core/AppContext.hpp"
#include "tasklist/core/AppSettings.hpp"
#include "tasklist/core/Logging.hpp"
#include "tasklist/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Tasklist"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("tasklist.local"));
    QCoreApplication::setApplicationName(QStringLiteral("Task List"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskListVersion));

    QApplication app(argc, argv);
    const QIcon appIcon(QStringLiteral(":/icons/app-icon.svg"));
    app.setWindowIcon(appIcon);

    tasklist::core::initLogging(tasklist::core::settings::logFilePath());

    tasklist::core::AppContext context;
    const QString databasePath = tasklist::core::settings::databasePath();
    if (!context.initialize(databasePath)) {
        qCCritical(appSql) << "Startup failed:" << context.lastError();
        QMessageBox::critical(nullptr,
                              QObject::tr("Task List"),
                              QObject::tr("The task database %1 could not be opened:\n%2")
                                  .arg(databasePath, context.lastError()));
        return 1;
    }

    tasklist::ui::MainWindow mainWindow(context);
    mainWindow.setWindowTitle(QObject::tr("Task List %1").arg(QString::fromLatin1(kTaskListVersion)));
    mainWindow.setWindowIcon(appIcon);
    mainWindow.show();

    return app.exec();
}
