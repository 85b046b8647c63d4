#ifndef TRANSACTIONGUARD_H
#define TRANSACTIONGUARD_H

#include <QSqlDatabase>
#include <QString>

#include <functional>

/**
 * @brief Единица работы над соединением (RAII)
 *
 * Внешний guard открывает транзакцию, вложенные присоединяются к ней.
 * Вложенный guard, разрушенный без commit(), помечает всю единицу
 * как rollback-only. Пока жив хотя бы один guard, удерживается
 * общий на процесс замок записи.
 */
class TransactionGuard
{
public:
    explicit TransactionGuard(QSqlDatabase db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    bool isActive() const { return m_active; }
    bool isOutermost() const { return m_outermost; }

    bool commit();
    void rollback();

    /**
     * @brief Выполнить callback после успешного commit внешней транзакции
     *
     * Callback вызывается вне замка записи; при откате отбрасывается.
     */
    void afterCommit(std::function<void()> callback);

    QString lastError() const { return m_lastError; }

private:
    void release();

    QSqlDatabase m_db;
    bool m_active = false;
    bool m_outermost = false;
    bool m_finished = false;
    QString m_lastError;
};

#endif // TRANSACTIONGUARD_H
