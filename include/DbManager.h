#ifndef DBMANAGER_H
#define DBMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

class DbManager : public QObject
{
    Q_OBJECT

public:
    static DbManager& instance();

    bool initialize(const QString &databasePath, int busyTimeoutMs = 5000);
    bool isOpen() const;

    QSqlDatabase database() const;
    QString databasePath() const;

    void close();

private:
    explicit DbManager();
    ~DbManager() override = default;

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

private:
    QSqlDatabase m_db;
    QString m_databasePath;

private:
    bool enableForeignKeys();
    bool setBusyTimeout(int timeoutMs);
};

#endif // DBMANAGER_H
