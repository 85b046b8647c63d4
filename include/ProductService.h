#ifndef PRODUCTSERVICE_H
#define PRODUCTSERVICE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QSqlDatabase>

#include "StockError.h"
#include "DecimalUtils.h"
#include "repositories/IProductRepository.h"
#include "repositories/ILedgerRepository.h"

class StockService;

struct ProductRequest {
    QString name;
    QString category;
    Decimal buyPrice = 0;
    Decimal sellPrice = 0;
    int stock = 0;
};

/**
 * @brief Ручное ведение справочника товаров
 *
 * Остаток задаётся только через журнал: товар создаётся с нулём,
 * затем начальный остаток проводится записью "Initial stock".
 */
class ProductService : public QObject
{
    Q_OBJECT

public:
    explicit ProductService(
        IProductRepository* productRepo,
        ILedgerRepository* ledgerRepo,
        StockService* stockService,
        QSqlDatabase db,
        QObject *parent = nullptr
    );

    /**
     * @return ID нового товара или -1
     */
    int addProduct(const ProductRequest &request, StockError *error = nullptr);

    bool updateProduct(int productId, const ProductRequest &request, StockError *error = nullptr);

    /**
     * @brief Удалить товар вместе с журналом
     *
     * Запрещено, пока на товар ссылаются продажи, списания или счета.
     */
    bool deleteProduct(int productId, StockError *error = nullptr);

    QStringList productNames();

    /**
     * @brief Проверка полей товара (наименование, категория, цены, остаток)
     */
    static bool validateFields(const ProductRequest &request, StockError *error, int recordId = 0);

private:
    IProductRepository* m_productRepo;
    ILedgerRepository* m_ledgerRepo;
    StockService* m_stockService;
    QSqlDatabase m_db;
};

#endif // PRODUCTSERVICE_H
