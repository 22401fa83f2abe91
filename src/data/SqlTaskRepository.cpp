#include "tasklist/data/SqlTaskRepository.hpp"

#include <QAtomicInt>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QVariant>

#include "tasklist/core/Logging.hpp"

namespace tasklist {
namespace data {

namespace {

QAtomicInt g_connectionCounter;

QString nextConnectionName()
{
    return QStringLiteral("tasklist-%1").arg(g_connectionCounter.fetchAndAddRelaxed(1));
}

QVariant descriptionValue(const std::optional<QString> &description)
{
    if (!description.has_value()) {
        return QVariant();
    }
    return *description;
}

TaskItem rowToTask(const QSqlQuery &query)
{
    TaskItem task;
    task.id = query.value(0).toLongLong();
    task.title = query.value(1).toString();
    const QVariant description = query.value(2);
    if (!description.isNull()) {
        task.description = description.toString();
    }
    task.done = query.value(3).toBool();
    task.deleted = query.value(4).toBool();
    return task;
}

} // namespace

SqlTaskRepository::SqlTaskRepository()
    : m_connectionName(nextConnectionName())
{
}

SqlTaskRepository::~SqlTaskRepository()
{
    if (m_db.isValid()) {
        if (m_db.isOpen()) {
            m_db.close();
        }
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool SqlTaskRepository::open(const QString &databasePath)
{
    if (m_db.isOpen()) {
        m_db.close();
    }
    if (!m_db.isValid()) {
        m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    }
    if (!m_db.isValid()) {
        m_lastError = QStringLiteral("SQLite driver not available");
        qCCritical(appSql) << m_lastError;
        return false;
    }
    m_db.setDatabaseName(databasePath);

    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        qCCritical(appSql) << "Failed to open database" << databasePath << ":" << m_lastError;
        return false;
    }

    if (!ensureSchema()) {
        qCCritical(appSql) << "Failed to ensure schema:" << m_lastError;
        m_db.close();
        return false;
    }

    qCInfo(appSql) << "Database ready, path:" << databasePath;
    return true;
}

bool SqlTaskRepository::isOpen() const
{
    return m_db.isValid() && m_db.isOpen();
}

bool SqlTaskRepository::ensureSchema()
{
    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("CREATE TABLE IF NOT EXISTS tasks ("
                                   "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                                   "  title TEXT NOT NULL,"
                                   "  description TEXT,"
                                   "  done BOOLEAN NOT NULL DEFAULT 0,"
                                   "  deleted BOOLEAN NOT NULL DEFAULT 0"
                                   ")"))) {
        m_lastError = query.lastError().text();
        return false;
    }

    // Databases written before soft delete existed have no deleted column.
    if (!query.exec(QStringLiteral("PRAGMA table_info(tasks)"))) {
        m_lastError = query.lastError().text();
        return false;
    }
    QStringList columns;
    while (query.next()) {
        columns << query.value(1).toString();
    }
    if (!columns.contains(QStringLiteral("deleted"))) {
        qCInfo(appSql) << "Migrating tasks table: adding deleted column";
        if (!query.exec(QStringLiteral("ALTER TABLE tasks ADD COLUMN deleted BOOLEAN NOT NULL DEFAULT 0"))) {
            m_lastError = query.lastError().text();
            return false;
        }
    }
    return true;
}

bool SqlTaskRepository::checkOpen(const char *operation) const
{
    if (isOpen()) {
        return true;
    }
    m_lastError = QStringLiteral("Database is not open");
    qCWarning(appSql) << operation << ":" << m_lastError;
    return false;
}

std::optional<std::vector<TaskItem>> SqlTaskRepository::fetchTasks() const
{
    if (!checkOpen("fetchTasks")) {
        return std::nullopt;
    }

    QSqlQuery query(m_db);
    if (!query.exec(QStringLiteral("SELECT id, title, description, done, deleted FROM tasks"))) {
        m_lastError = query.lastError().text();
        qCWarning(appSql) << "fetchTasks:" << m_lastError;
        return std::nullopt;
    }

    std::vector<TaskItem> tasks;
    while (query.next()) {
        tasks.push_back(rowToTask(query));
    }
    qCDebug(appSql) << tasks.size() << "tasks fetched";
    return tasks;
}

std::optional<qint64> SqlTaskRepository::addTask(const QString &title, const std::optional<QString> &description)
{
    if (!checkOpen("addTask")) {
        return std::nullopt;
    }

    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("INSERT INTO tasks (title, description, done, deleted) VALUES (?, ?, 0, 0)"));
    query.addBindValue(title);
    query.addBindValue(descriptionValue(description));
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qCWarning(appSql) << "addTask:" << m_lastError;
        return std::nullopt;
    }

    const qint64 id = query.lastInsertId().toLongLong();
    qCInfo(appSql) << "Task inserted id=" << id;
    return id;
}

bool SqlTaskRepository::updateTask(qint64 id, const QString &title, const std::optional<QString> &description)
{
    if (!checkOpen("updateTask")) {
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("UPDATE tasks SET title = ?, description = ? WHERE id = ?"));
    query.addBindValue(title);
    query.addBindValue(descriptionValue(description));
    query.addBindValue(id);
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qCWarning(appSql) << "updateTask:" << m_lastError;
        return false;
    }
    if (query.numRowsAffected() == 0) {
        qCInfo(appSql) << "updateTask: no task with id=" << id;
    }
    return true;
}

bool SqlTaskRepository::toggleDone(qint64 id)
{
    if (!checkOpen("toggleDone")) {
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("UPDATE tasks SET done = NOT done WHERE id = ?"));
    query.addBindValue(id);
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qCWarning(appSql) << "toggleDone:" << m_lastError;
        return false;
    }
    if (query.numRowsAffected() == 0) {
        qCInfo(appSql) << "toggleDone: no task with id=" << id;
    }
    return true;
}

bool SqlTaskRepository::setDeleted(qint64 id, bool deleted)
{
    if (!checkOpen("setDeleted")) {
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare(QStringLiteral("UPDATE tasks SET deleted = ? WHERE id = ?"));
    query.addBindValue(deleted ? 1 : 0);
    query.addBindValue(id);
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qCWarning(appSql) << "setDeleted:" << m_lastError;
        return false;
    }
    if (query.numRowsAffected() == 0) {
        qCInfo(appSql) << "setDeleted: no task with id=" << id;
    }
    return true;
}

QString SqlTaskRepository::lastError() const
{
    return m_lastError;
}

} // namespace data
} // namespace tasklist
