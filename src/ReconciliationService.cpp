#include "ReconciliationService.h"
#include "StockError.h"
#include "TransactionGuard.h"
#include "DateTimeUtils.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(reconService, "service.reconciliation")

namespace {
const char* const kReconciliationReason = "Stock reconciliation";
}

ReconciliationService::ReconciliationService(ILedgerRepository* ledgerRepo, QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_ledgerRepo(ledgerRepo)
    , m_db(db)
{
}

QList<LedgerBalance> ReconciliationService::findDrift(bool *ok)
{
    QList<LedgerBalance> res;
    bool readOk = false;
    const QList<LedgerBalance> balances = m_ledgerRepo->allBalances(&readOk);
    if (ok) *ok = readOk;
    if (!readOk) {
        qCritical(reconService) << "ReconciliationService::findDrift: Cannot read balances";
        return res;
    }

    for (const auto &balance : balances) {
        if (balance.hasDrift()) res.append(balance);
    }
    return res;
}

QList<StockCorrection> ReconciliationService::reconcile()
{
    bool ok = false;
    const QList<LedgerBalance> candidates = findDrift(&ok);
    if (!ok) {
        return {};
    }
    return reconcile(candidates);
}

QList<StockCorrection> ReconciliationService::reconcile(const QList<LedgerBalance> &candidates)
{
    QList<StockCorrection> corrections;

    for (const auto &candidate : candidates) {
        const StockError drift = StockError::driftDetected(candidate.productId, candidate.stock, candidate.ledgerSum);
        qWarning(reconService) << "ReconciliationService::reconcile:" << drift.message;

        StockCorrection correction;
        if (correct(candidate, correction)) {
            corrections.append(correction);
        }
    }

    qInfo(reconService) << "ReconciliationService::reconcile: checked, corrections:" << corrections.size();
    return corrections;
}

bool ReconciliationService::correct(const LedgerBalance &candidate, StockCorrection &correction)
{
    TransactionGuard tx(m_db);
    if (!tx.isActive()) {
        qCritical(reconService) << "ReconciliationService::correct: Cannot start transaction for product"
                                << candidate.productId << ":" << tx.lastError();
        return false;
    }

    bool ok = false;
    const LedgerBalance fresh = m_ledgerRepo->balanceForProduct(candidate.productId, &ok);
    if (!ok) {
        qCritical(reconService) << "ReconciliationService::correct: Cannot re-read product" << candidate.productId;
        return false;
    }

    if (!fresh.isValid() || !fresh.hasDrift()) {
        qInfo(reconService) << "ReconciliationService::correct: Drift of product" << candidate.productId
                            << "vanished on re-read, skipped";
        tx.rollback();
        return false;
    }

    LedgerEntry entry;
    entry.productId = fresh.productId;
    entry.createdAt = currentTimestamp();
    entry.quantityChange = fresh.stock - fresh.ledgerSum;
    entry.reason = kReconciliationReason;

    const int entryId = m_ledgerRepo->append(entry);
    if (entryId < 0) {
        qCritical(reconService) << "ReconciliationService::correct: Cannot append correction for product" << fresh.productId;
        return false;
    }

    if (!tx.commit()) {
        qCritical(reconService) << "ReconciliationService::correct: Commit failed for product" << fresh.productId
                                << ":" << tx.lastError();
        return false;
    }

    correction.productId = fresh.productId;
    correction.productName = fresh.productName;
    correction.ledgerSum = fresh.ledgerSum;
    correction.stock = fresh.stock;
    correction.ledgerEntryId = entryId;

    qInfo(reconService) << "ReconciliationService::correct:" << fresh.productName
                        << "ledger" << fresh.ledgerSum << "-> stock" << fresh.stock
                        << "(delta" << correction.delta() << ")";
    return true;
}
