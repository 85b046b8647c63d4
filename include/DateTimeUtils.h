#ifndef DATETIMEUTILS_H
#define DATETIMEUTILS_H

#include <QDate>
#include <QDateTime>
#include <QString>

// Формат хранения меток времени в базе: "yyyy-MM-dd HH:mm:ss"
inline const QString& timestampFormat()
{
    static const QString format = QStringLiteral("yyyy-MM-dd HH:mm:ss");
    return format;
}

inline QString timestampToString(const QDateTime &value)
{
    return value.toString(timestampFormat());
}

inline QDateTime timestampFromString(const QString &value)
{
    const QString trimmed = value.trimmed();
    QDateTime result = QDateTime::fromString(trimmed, timestampFormat());
    if (!result.isValid()) {
        result = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    if (!result.isValid()) {
        const QDate date = QDate::fromString(trimmed, Qt::ISODate);
        if (date.isValid()) {
            result = date.startOfDay();
        }
    }
    return result;
}

// Метки времени хранятся с точностью до секунды
inline QDateTime currentTimestamp()
{
    const QDateTime now = QDateTime::currentDateTime();
    return QDateTime(now.date(), QTime(now.time().hour(), now.time().minute(), now.time().second()));
}

#endif // DATETIMEUTILS_H
