#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Строка таблицы valuation_dates
 *
 * Само наличие строки делает дату датой оценки. Fund Value, если задан,
 * подменяет стартовую стоимость фонда в этот день.
 */
struct ValuationOverride {
    std::string date;                   ///< PK, MM/DD/YYYY
    std::optional<double> fundValue;    ///< Fund Value
};

} // namespace navledger::domain
