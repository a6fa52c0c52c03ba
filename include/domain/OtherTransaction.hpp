#pragma once

#include <cstdint>
#include <string>

namespace navledger::domain {

/**
 * @brief Строка таблицы other_transactions - движение денег вне брокера
 *
 * Кортеж (date, accountDescription, transactionDescription, amount)
 * уникален: повторная вставка обновляет флаги и примечание.
 */
struct OtherTransaction {
    int64_t id = 0;                     ///< Суррогатный ключ (0 - ещё не сохранена)
    std::string date;                   ///< MM/DD/YYYY
    double amount = 0.0;                ///< Сумма со знаком
    std::string accountDescription;     ///< Account Description
    std::string transactionDescription; ///< Transaction Description
    bool countedInPnl = false;          ///< Counted in P&L
    bool overnight = false;             ///< Overnight: переходит в стартовую стоимость следующего дня
    std::string additionalInfo;         ///< Additional Info

    OtherTransaction() = default;

    OtherTransaction(
        const std::string& date,
        double amount,
        const std::string& accountDescription,
        const std::string& transactionDescription,
        bool countedInPnl,
        bool overnight,
        const std::string& additionalInfo = ""
    ) : date(date), amount(amount), accountDescription(accountDescription),
        transactionDescription(transactionDescription), countedInPnl(countedInPnl),
        overnight(overnight), additionalInfo(additionalInfo) {}

    /**
     * @brief Совпадает ли ключ уникальности
     */
    bool sameKey(const OtherTransaction& other) const {
        return date == other.date &&
               accountDescription == other.accountDescription &&
               transactionDescription == other.transactionDescription &&
               amount == other.amount;
    }
};

} // namespace navledger::domain
