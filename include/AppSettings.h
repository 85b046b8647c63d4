#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>

#include "DecimalUtils.h"

struct EngineConfig {
    QString databasePath;
    int lowStockThreshold = 5;
    Decimal taxRate = Decimal("0.13");
    QString invoicePrefix = "INV";
    int filterDebounceMs = 300;
    bool reconcileOnStartup = true;
    int storageTimeoutMs = 5000;
};

/**
 * @brief Настройки приложения (INI через QSettings)
 *
 * При отсутствии файла он создаётся со значениями по умолчанию.
 */
class AppSettings
{
public:
    explicit AppSettings(const QString &iniPath = QString());

    static QString defaultConfigPath();
    static QString defaultDatabasePath();

    QString path() const;

    EngineConfig load();
    bool save(const EngineConfig &config);

private:
    QString m_path;
};

#endif // APPSETTINGS_H
