#include "DbManager.h"

#include <QDebug>
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(dbLog, "db")

namespace {
const char* const kConnectionName = "StockLedgerConnection";
}

DbManager& DbManager::instance()
{
    static DbManager instance;
    return instance;
}

DbManager::DbManager()
{
}

bool DbManager::initialize(const QString &databasePath, int busyTimeoutMs)
{
    if (QSqlDatabase::contains(kConnectionName)) {
        m_db = QSqlDatabase::database(kConnectionName, false);
    } else {
        m_db = QSqlDatabase::addDatabase("QSQLITE", kConnectionName);
    }

    if (m_db.isOpen()) {
        qInfo(dbLog) << "DbManager: Reopening connection for" << databasePath;
        m_db.close();
    }

    m_databasePath = databasePath;
    m_db.setDatabaseName(m_databasePath);

    if (!m_db.open()) {
        qCritical(dbLog) << "DbManager: Cannot open database:" << m_db.lastError().text();
        qCritical(dbLog) << "DbManager: Database path:" << m_databasePath;
        return false;
    }

    qInfo(dbLog) << "DbManager: Database opened successfully at" << m_databasePath;

    if (!enableForeignKeys()) {
        qCritical(dbLog) << "DbManager: Cannot enable foreign keys";
        return false;
    }

    if (!setBusyTimeout(busyTimeoutMs)) {
        qWarning(dbLog) << "DbManager: busy_timeout not applied, storage waits are unbounded";
    }

    return true;
}

bool DbManager::isOpen() const
{
    return m_db.isOpen();
}

QSqlDatabase DbManager::database() const
{
    return m_db;
}

QString DbManager::databasePath() const
{
    return m_databasePath;
}

void DbManager::close()
{
    if (m_db.isOpen()) {
        m_db.close();
        qInfo(dbLog) << "DbManager: Database connection closed";
    }
}

bool DbManager::enableForeignKeys()
{
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA foreign_keys = ON")) {
        qCritical(dbLog) << "DbManager: Cannot enable foreign keys:" << query.lastError().text();
        return false;
    }

    if (query.exec("PRAGMA foreign_keys")) {
        if (query.next()) {
            const int fkEnabled = query.value(0).toInt();
            if (fkEnabled == 1) {
                qInfo(dbLog) << "DbManager: Foreign keys enabled";
                return true;
            }
        }
    }

    qWarning(dbLog) << "DbManager: Foreign keys check failed";
    return false;
}

bool DbManager::setBusyTimeout(int timeoutMs)
{
    if (timeoutMs <= 0) return true;

    QSqlQuery query(m_db);
    if (!query.exec(QString("PRAGMA busy_timeout = %1").arg(timeoutMs))) {
        qWarning(dbLog) << "DbManager: Cannot set busy_timeout:" << query.lastError().text();
        return false;
    }
    return true;
}
