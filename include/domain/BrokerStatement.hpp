#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Нормализованная выписка брокера за один день
 *
 * Раздел "Change in NAV" брокерской выписки. Отсутствующее поле
 * (nullopt) и нулевое поле различаются: от этого зависит, какой
 * из методов расчёта P&L вообще вычислим.
 */
struct BrokerStatement {
    std::string date;                                   ///< MM/DD/YYYY
    std::optional<double> startingValue;                ///< Starting Value
    std::optional<double> endingValue;                  ///< Ending Value (= Total Broker)
    std::optional<double> markToMarket;                 ///< Mark-to-Market
    std::optional<double> interest;                     ///< Interest
    std::optional<double> dividends;                    ///< Dividends
    std::optional<double> changeInInterestAccruals;     ///< Change in Interest Accruals
    std::optional<double> changeInDividendAccruals;     ///< Change in Dividend Accruals
    std::optional<double> commissions;                  ///< Commissions
    std::optional<double> depositsWithdrawals;          ///< Deposits & Withdrawals
};

} // namespace navledger::domain
