#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <QTextStream>

#include "StockError.h"

class InventoryEngine;

/**
 * @brief Выполнение одной команды stockledger
 *
 * Коды возврата: 0 - успех, 1 - ошибка ввода / бизнес-правила, 2 - ошибка хранилища.
 */
class CommandRunner
{
public:
    enum ExitCode {
        Success = 0,
        BusinessError = 1,
        StorageError = 2
    };

    CommandRunner(InventoryEngine &engine, const QCommandLineParser &parser);

    static QList<QCommandLineOption> options();
    static QString commandsHelp();

    int run(const QStringList &arguments);

private:
    int listProducts();
    int addProduct(const QStringList &args);
    int updateProduct(const QStringList &args);
    int deleteProduct(const QStringList &args);
    int adjust(const QStringList &args);
    int history(const QStringList &args);
    int sale(const QStringList &args);
    int editSale(const QStringList &args);
    int deleteSale(const QStringList &args);
    int damage(const QStringList &args);
    int replaceDamage(const QStringList &args);
    int deleteDamage(const QStringList &args);
    int invoiceFromStock(const QStringList &args);
    int invoiceFromSale(const QStringList &args);
    int deleteInvoice(const QStringList &args);
    int importCsv(const QStringList &args);
    int exportCsv(const QStringList &args);
    int reconcile();
    int summary();

    int fail(const StockError &error);
    int usage(const QString &syntax);

    bool parseInt(const QString &text, const QString &what, int *value);
    bool parseDecimal(const QString &text, const QString &what, Decimal *value);
    bool parseDate(QDate *date);

    InventoryEngine &m_engine;
    const QCommandLineParser &m_parser;
    QTextStream m_out;
    QTextStream m_err;
};

#endif // COMMANDRUNNER_H
