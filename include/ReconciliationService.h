#ifndef RECONCILIATIONSERVICE_H
#define RECONCILIATIONSERVICE_H

#include <QObject>
#include <QList>
#include <QString>
#include <QSqlDatabase>

#include "repositories/ILedgerRepository.h"

/**
 * @brief Исправление расхождения между остатком и журналом одного товара
 *
 * ledgerSum - сумма журнала до исправления, stock - остаток (остаётся как был).
 */
struct StockCorrection {
    int productId = 0;
    QString productName;
    int ledgerSum = 0;
    int stock = 0;
    int ledgerEntryId = 0;

    int delta() const { return stock - ledgerSum; }
};

/**
 * @brief Сверка остатков с журналом
 *
 * Остаток товара считается верным, журнал дописывается корректирующей записью.
 * Перед записью расхождение перечитывается одним запросом под замком записи:
 * исчезнувшее расхождение пропускается. Ошибки по отдельному товару
 * логируются и не прерывают сверку.
 */
class ReconciliationService : public QObject
{
    Q_OBJECT

public:
    explicit ReconciliationService(ILedgerRepository* ledgerRepo, QSqlDatabase db, QObject *parent = nullptr);

    QList<StockCorrection> reconcile();

    /**
     * @brief Исправить ранее найденные расхождения (результат findDrift())
     *
     * Каждый кандидат перечитывается перед исправлением.
     */
    QList<StockCorrection> reconcile(const QList<LedgerBalance> &candidates);

    /**
     * @brief Товары с расхождением (без исправления)
     */
    QList<LedgerBalance> findDrift(bool *ok = nullptr);

private:
    bool correct(const LedgerBalance &candidate, StockCorrection &correction);

    ILedgerRepository* m_ledgerRepo;
    QSqlDatabase m_db;
};

#endif // RECONCILIATIONSERVICE_H
