#ifndef INVOICESERVICE_H
#define INVOICESERVICE_H

#include <QObject>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <QSqlDatabase>

#include <optional>

#include "StockError.h"
#include "DecimalUtils.h"
#include "repositories/IInvoiceRepository.h"
#include "repositories/IInvoiceItemRepository.h"
#include "repositories/ISaleRepository.h"
#include "repositories/IProductRepository.h"

class StockService;

enum class InvoiceSource {
    FromStock,
    FromSale
};

/**
 * @brief Данные для выписки счёта
 *
 * FromSale: пустые productName / quantity / discount берутся из продажи,
 * заданные должны с ней совпадать.
 */
struct InvoiceRequest {
    InvoiceSource source = InvoiceSource::FromStock;
    QString number;
    QDate date = QDate::currentDate();
    QString customerName;
    QString productName;
    int quantity = 0;
    std::optional<Decimal> discount;
    int saleId = 0;
};

class InvoiceService : public QObject
{
    Q_OBJECT

public:
    explicit InvoiceService(
        IInvoiceRepository* invoiceRepo,
        IInvoiceItemRepository* itemRepo,
        ISaleRepository* saleRepo,
        IProductRepository* productRepo,
        StockService* stockService,
        QSqlDatabase db,
        QObject *parent = nullptr
    );

    void setTaxRate(const Decimal &taxRate) { m_taxRate = taxRate; }
    Decimal taxRate() const { return m_taxRate; }

    void setNumberPrefix(const QString &prefix) { m_numberPrefix = prefix; }
    QString numberPrefix() const { return m_numberPrefix; }

    /**
     * @return ID счёта или -1
     */
    int createInvoice(const InvoiceRequest &request, StockError *error = nullptr);

    /**
     * @brief Удалить счёт; счёт со склада возвращает количество на склад
     */
    bool deleteInvoice(int invoiceId, StockError *error = nullptr);

    /**
     * @brief Свободный номер вида PREFIX-yyyy-MM-dd-HHmmss[-N]
     */
    QString generateNumber(const QDateTime &timestamp, StockError *error = nullptr);

private:
    IInvoiceRepository* m_invoiceRepo;
    IInvoiceItemRepository* m_itemRepo;
    ISaleRepository* m_saleRepo;
    IProductRepository* m_productRepo;
    StockService* m_stockService;
    QSqlDatabase m_db;
    Decimal m_taxRate = Decimal("0.13");
    QString m_numberPrefix = "INV";
};

#endif // INVOICESERVICE_H
