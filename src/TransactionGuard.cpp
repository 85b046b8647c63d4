#include "TransactionGuard.h"

#include <QHash>
#include <QList>
#include <QRecursiveMutex>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(txLog, "db.transaction")

namespace {

struct UnitState {
    int depth = 0;
    bool rollbackOnly = false;
    QList<std::function<void()>> afterCommit;
};

QRecursiveMutex& writeLock()
{
    static QRecursiveMutex mutex;
    return mutex;
}

// Доступ только под writeLock()
QHash<QString, UnitState>& unitStates()
{
    static QHash<QString, UnitState> states;
    return states;
}

} // namespace

TransactionGuard::TransactionGuard(QSqlDatabase db)
    : m_db(db)
{
    writeLock().lock();

    UnitState &state = unitStates()[m_db.connectionName()];
    if (state.depth == 0) {
        if (!m_db.isOpen() || !m_db.transaction()) {
            m_lastError = m_db.isOpen() ? m_db.lastError().text() : QString("Database is not open");
            qCritical(txLog) << "TransactionGuard: Cannot start transaction:" << m_lastError;
            writeLock().unlock();
            return;
        }
        m_outermost = true;
        state.rollbackOnly = false;
        state.afterCommit.clear();
    }

    ++state.depth;
    m_active = true;
}

TransactionGuard::~TransactionGuard()
{
    if (m_active && !m_finished) {
        rollback();
    }
}

bool TransactionGuard::commit()
{
    if (!m_active || m_finished) {
        return false;
    }
    m_finished = true;

    UnitState &state = unitStates()[m_db.connectionName()];

    if (!m_outermost) {
        const bool ok = !state.rollbackOnly;
        release();
        return ok;
    }

    if (state.rollbackOnly) {
        m_lastError = "Transaction marked rollback-only by a nested unit";
        qWarning(txLog) << "TransactionGuard::commit:" << m_lastError;
        m_db.rollback();
        state.afterCommit.clear();
        release();
        return false;
    }

    if (!m_db.commit()) {
        m_lastError = m_db.lastError().text();
        qCritical(txLog) << "TransactionGuard::commit: commit() failed:" << m_lastError;
        m_db.rollback();
        state.afterCommit.clear();
        release();
        return false;
    }

    const QList<std::function<void()>> callbacks = state.afterCommit;
    state.afterCommit.clear();
    release();

    for (const auto &callback : callbacks) {
        callback();
    }
    return true;
}

void TransactionGuard::rollback()
{
    if (!m_active || m_finished) {
        return;
    }
    m_finished = true;

    UnitState &state = unitStates()[m_db.connectionName()];
    if (m_outermost) {
        if (!m_db.rollback()) {
            qCritical(txLog) << "TransactionGuard::rollback: rollback() failed:" << m_db.lastError().text();
        }
        state.afterCommit.clear();
    } else {
        state.rollbackOnly = true;
    }
    release();
}

void TransactionGuard::afterCommit(std::function<void()> callback)
{
    if (!m_active || m_finished) {
        return;
    }
    unitStates()[m_db.connectionName()].afterCommit.append(std::move(callback));
}

void TransactionGuard::release()
{
    UnitState &state = unitStates()[m_db.connectionName()];
    --state.depth;
    if (state.depth == 0) {
        state.rollbackOnly = false;
    }
    writeLock().unlock();
}
