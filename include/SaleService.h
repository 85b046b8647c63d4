#ifndef SALESERVICE_H
#define SALESERVICE_H

#include <QObject>
#include <QDate>
#include <QString>
#include <QSqlDatabase>

#include "StockError.h"
#include "DecimalUtils.h"
#include "repositories/ISaleRepository.h"
#include "repositories/IProductRepository.h"
#include "repositories/IInvoiceRepository.h"

class StockService;

struct SaleRequest {
    QDate date = QDate::currentDate();
    QString itemName;
    int quantity = 0;
    Decimal unitPrice = 0;
    Decimal discount = 0;
};

class SaleService : public QObject
{
    Q_OBJECT

public:
    explicit SaleService(
        ISaleRepository* saleRepo,
        IProductRepository* productRepo,
        IInvoiceRepository* invoiceRepo,
        StockService* stockService,
        QSqlDatabase db,
        QObject *parent = nullptr
    );

    /**
     * @brief Провести продажу: запись продажи и списание остатка
     * @return ID продажи или -1
     */
    int createSale(const SaleRequest &request, StockError *error = nullptr);

    /**
     * @brief Изменить продажу
     *
     * Тот же товар - одна запись на разницу (old - new).
     * Другой товар - возврат старого количества и списание нового в одной транзакции.
     */
    bool editSale(int saleId, const SaleRequest &request, StockError *error = nullptr);

    /**
     * @brief Удалить продажу и вернуть количество на склад
     *
     * Продажу, по которой выписан счёт, удалить нельзя.
     */
    bool deleteSale(int saleId, StockError *error = nullptr);

    static Decimal saleTotal(int quantity, const Decimal &unitPrice, const Decimal &discount);

private:
    bool validate(const SaleRequest &request, StockError *error, int recordId = 0) const;
    Product resolveProduct(const QString &itemName, StockError *error);

    ISaleRepository* m_saleRepo;
    IProductRepository* m_productRepo;
    IInvoiceRepository* m_invoiceRepo;
    StockService* m_stockService;
    QSqlDatabase m_db;
};

#endif // SALESERVICE_H
