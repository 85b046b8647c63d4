#include "LowStockNotifier.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lowStockLog, "service.lowstock")

LowStockNotifier::LowStockNotifier(QObject *parent)
    : QObject(parent)
{
}

QMetaObject::Connection LowStockNotifier::subscribe(Callback callback)
{
    return subscribe(this, std::move(callback));
}

QMetaObject::Connection LowStockNotifier::subscribe(QObject *context, Callback callback)
{
    if (!callback) {
        qWarning(lowStockLog) << "LowStockNotifier::subscribe: empty callback";
        return {};
    }

    return connect(this, &LowStockNotifier::lowStock, context ? context : this,
                   [callback](int productId, const QString &productName, int quantity) {
                       callback(productId, productName, quantity);
                   },
                   Qt::QueuedConnection);
}

void LowStockNotifier::unsubscribe(const QMetaObject::Connection &connection)
{
    disconnect(connection);
}

void LowStockNotifier::notify(int productId, const QString &productName, int quantity)
{
    qInfo(lowStockLog) << "LowStockNotifier::notify: Low stock for" << productName
                       << "(id" << productId << "):" << quantity << "left";
    emit lowStock(productId, productName, quantity);
}
