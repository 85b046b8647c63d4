#ifndef STOCKERROR_H
#define STOCKERROR_H

#include <QString>

/**
 * @brief Категории ошибок складского движка
 */
enum class StockErrorKind {
    None,
    Validation,
    InsufficientStock,
    AlreadyReplaced,
    SaleMismatch,
    Storage,
    DriftDetected
};

/**
 * @brief Описание ошибки операции
 *
 * available - доступный остаток (InsufficientStock),
 * recordId  - конфликтующая запись (товар, продажа, списание, строка импорта).
 */
struct StockError {
    StockErrorKind kind = StockErrorKind::None;
    QString message;
    int available = 0;
    int recordId = 0;

    bool isError() const { return kind != StockErrorKind::None; }
    bool isBusinessRule() const;
    QString kindString() const;

    static StockError validation(const QString &message, int recordId = 0);
    static StockError insufficientStock(int productId, int available, int requested);
    static StockError alreadyReplaced(int damageId);
    static StockError saleMismatch(int saleId, const QString &message);
    static StockError storage(const QString &message);
    static StockError driftDetected(int productId, int stock, int ledgerSum);
};

inline void setStockError(StockError *target, const StockError &error)
{
    if (target) {
        *target = error;
    }
}

#endif // STOCKERROR_H
