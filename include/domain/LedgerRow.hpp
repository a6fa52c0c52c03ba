#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Строка таблицы overall - итог дня в леджере
 *
 * Производные данные: вся таблица пересчитывается при каждой сборке.
 * nullopt означает "ещё не вычислимо" (до первой даты оценки или при
 * нулевом знаменателе), а не ошибку.
 */
struct LedgerRow {
    std::string date;                                       ///< Date
    std::optional<double> brokerPnl;                        ///< Broker P&L
    std::optional<double> totalBroker;                      ///< Total Broker
    double otherPnl = 0.0;                                  ///< Other P&L
    double totalOther = 0.0;                                ///< Total Other (нарастающий итог)
    double overnight = 0.0;                                 ///< Overnight (сумма ночных движений дня)
    double totalPnl = 0.0;                                  ///< Total P&L
    std::optional<double> periodStartingNav;                ///< Period Starting NAV
    double startFundValue = 0.0;                            ///< Start Fund Value (Accounts Total)
    double endFundValue = 0.0;                              ///< End Fund Value (Accounts Total)
    std::optional<double> startFundValueWithCumPnl;         ///< Start Fund Value (NAV + Cum. P&L)
    std::optional<double> endFundValueWithCumPnl;           ///< End Fund Value (NAV + Cum. P&L)
    std::optional<double> periodCumulativePnl;              ///< Period Cumulative P&L (включая день)
    std::optional<double> dailyReturn;                      ///< Daily Return
    std::optional<double> periodCumulativeReturn;           ///< Period Cumulative Return
    bool valuationDate = false;                             ///< Valuation Date

    bool operator==(const LedgerRow& other) const {
        return date == other.date &&
               brokerPnl == other.brokerPnl &&
               totalBroker == other.totalBroker &&
               otherPnl == other.otherPnl &&
               totalOther == other.totalOther &&
               overnight == other.overnight &&
               totalPnl == other.totalPnl &&
               periodStartingNav == other.periodStartingNav &&
               startFundValue == other.startFundValue &&
               endFundValue == other.endFundValue &&
               startFundValueWithCumPnl == other.startFundValueWithCumPnl &&
               endFundValueWithCumPnl == other.endFundValueWithCumPnl &&
               periodCumulativePnl == other.periodCumulativePnl &&
               dailyReturn == other.dailyReturn &&
               periodCumulativeReturn == other.periodCumulativeReturn &&
               valuationDate == other.valuationDate;
    }
    bool operator!=(const LedgerRow& other) const { return !(*this == other); }
};

} // namespace navledger::domain
