#pragma once

#include "BrokerDayRecord.hpp"
#include "LedgerRow.hpp"
#include "OtherTransaction.hpp"
#include "PeriodReturn.hpp"
#include <optional>
#include <string>
#include <vector>

namespace navledger::domain {

/**
 * @brief Расхождение сохранённого P&L с формулой отчёта
 *
 * Формула: Total Broker - предыдущий Total Broker - D&W - Dividends - Interest
 */
struct PnlFormulaMismatch {
    std::string date;
    std::optional<double> storedPnl;    ///< nullopt - P&L в базе пуст
    double formulaPnl = 0.0;
    double difference = 0.0;
};

/**
 * @brief Данные отчёта за диапазон дат
 */
struct LedgerReport {
    std::string fromDate;
    std::string toDate;
    std::vector<LedgerRow> overall;
    std::vector<BrokerDayRecord> broker;
    std::vector<OtherTransaction> otherTransactions;
    std::vector<PeriodReturn> periodReturns;
    std::vector<PnlFormulaMismatch> pnlCheck;
};

} // namespace navledger::domain
