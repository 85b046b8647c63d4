#ifndef LOWSTOCKNOTIFIER_H
#define LOWSTOCKNOTIFIER_H

#include <QObject>
#include <QString>

#include <functional>

/**
 * @brief Уведомления о малом остатке
 *
 * Подписчики вызываются через очередь событий (Qt::QueuedConnection):
 * операция с остатком не ждёт их и не зависит от их результата.
 */
class LowStockNotifier : public QObject
{
    Q_OBJECT

public:
    using Callback = std::function<void(int productId, const QString &productName, int quantity)>;

    explicit LowStockNotifier(QObject *parent = nullptr);

    QMetaObject::Connection subscribe(Callback callback);
    QMetaObject::Connection subscribe(QObject *context, Callback callback);

    void unsubscribe(const QMetaObject::Connection &connection);

    void notify(int productId, const QString &productName, int quantity);

signals:
    void lowStock(int productId, const QString &productName, int quantity);
};

#endif // LOWSTOCKNOTIFIER_H
