#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Строка таблицы broker - снимок брокерского счёта на дату
 *
 * Не более одной записи на дату: повторная загрузка заменяет запись.
 */
struct BrokerDayRecord {
    std::string date;                                   ///< PK, MM/DD/YYYY
    std::optional<double> pnl;                          ///< P&L
    double reportingError = 0.0;                        ///< Reporting Error (>= 0)
    std::optional<double> cumulativePnl;                ///< Cumulative P&L
    std::optional<double> markToMarket;                 ///< Mark-to-Market
    std::optional<double> changeInDividendAccruals;     ///< Change in Dividend Accruals
    std::optional<double> interest;                     ///< Interest
    std::optional<double> dividends;                    ///< Dividends
    std::optional<double> depositsWithdrawals;          ///< Deposits & Withdrawals
    std::optional<double> changeInInterestAccruals;     ///< Change in Interest Accruals
    std::optional<double> commissions;                  ///< Commissions
    std::optional<double> totalBroker;                  ///< Total Broker
};

} // namespace navledger::domain
