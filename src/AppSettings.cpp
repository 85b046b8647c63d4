#include "AppSettings.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(settingsLog, "settings")

AppSettings::AppSettings(const QString &iniPath)
    : m_path(iniPath.isEmpty() ? defaultConfigPath() : iniPath)
{
}

QString AppSettings::defaultConfigPath()
{
    const QString configPath = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    QDir dir;
    if (!dir.exists(configPath)) {
        dir.mkpath(configPath);
    }
    return configPath + "/stockledger.ini";
}

QString AppSettings::defaultDatabasePath()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir;
    if (!dir.exists(dataPath)) {
        dir.mkpath(dataPath);
    }
    return dataPath + "/stockledger.db";
}

QString AppSettings::path() const
{
    return m_path;
}

EngineConfig AppSettings::load()
{
    EngineConfig config;
    config.databasePath = defaultDatabasePath();

    if (!QFile::exists(m_path)) {
        qInfo(settingsLog) << "AppSettings::load: No config at" << m_path << "- writing defaults";
        if (!save(config)) {
            qWarning(settingsLog) << "AppSettings::load: Cannot write default config, using built-in defaults";
        }
        return config;
    }

    QSettings settings(m_path, QSettings::IniFormat);

    config.databasePath = settings.value("Settings/database_path", config.databasePath).toString();
    config.lowStockThreshold = settings.value("Stock/low_stock_threshold", config.lowStockThreshold).toInt();
    config.reconcileOnStartup = settings.value("Stock/reconcile_on_startup", config.reconcileOnStartup).toBool();
    config.storageTimeoutMs = settings.value("Stock/storage_timeout_ms", config.storageTimeoutMs).toInt();
    config.invoicePrefix = settings.value("Invoice/number_prefix", config.invoicePrefix).toString();
    config.filterDebounceMs = settings.value("Filter/debounce_ms", config.filterDebounceMs).toInt();

    bool rateOk = false;
    const Decimal rate = decimalFromString(settings.value("Invoice/tax_rate").toString(), &rateOk);
    if (rateOk && rate >= 0) {
        config.taxRate = rate;
    }

    if (config.lowStockThreshold < 0) {
        qWarning(settingsLog) << "AppSettings::load: Negative low_stock_threshold, using 5";
        config.lowStockThreshold = 5;
    }
    if (config.filterDebounceMs < 0) {
        config.filterDebounceMs = 300;
    }

    qInfo(settingsLog) << "AppSettings::load: Loaded" << m_path;
    return config;
}

bool AppSettings::save(const EngineConfig &config)
{
    const QFileInfo info(m_path);
    QDir dir;
    if (!dir.exists(info.absolutePath())) {
        dir.mkpath(info.absolutePath());
    }

    QSettings settings(m_path, QSettings::IniFormat);
    settings.setValue("Settings/database_path", config.databasePath);
    settings.setValue("Stock/low_stock_threshold", config.lowStockThreshold);
    settings.setValue("Stock/reconcile_on_startup", config.reconcileOnStartup);
    settings.setValue("Stock/storage_timeout_ms", config.storageTimeoutMs);
    settings.setValue("Invoice/tax_rate", decimalToString(config.taxRate, 4));
    settings.setValue("Invoice/number_prefix", config.invoicePrefix);
    settings.setValue("Filter/debounce_ms", config.filterDebounceMs);
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        qCritical(settingsLog) << "AppSettings::save: Cannot write" << m_path;
        return false;
    }
    return true;
}
