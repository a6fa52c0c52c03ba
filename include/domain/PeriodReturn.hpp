#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Итог одного периода оценки (между соседними датами оценки)
 */
struct PeriodReturn {
    std::string startDate;                      ///< Дата оценки, открывшая период
    std::string endDate;                        ///< Последняя дата периода
    int days = 0;                               ///< Число строк леджера в периоде
    double startingNav = 0.0;                   ///< Period Starting NAV
    double cumulativePnl = 0.0;                 ///< Суммарный Total P&L за период
    double endingValue = 0.0;                   ///< startingNav + cumulativePnl
    std::optional<double> cumulativeReturn;     ///< cumulativePnl / startingNav
};

} // namespace navledger::domain
