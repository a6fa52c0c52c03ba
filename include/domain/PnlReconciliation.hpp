#pragma once

#include <optional>

namespace navledger::domain {

/**
 * @brief Результат сверки P&L двумя независимыми методами
 */
struct PnlReconciliation {
    std::optional<double> pnl;              ///< Итоговый P&L (nullopt - не вычислим)
    double reportingError = 0.0;            ///< |A - B|, если превышает допуск, иначе 0
    std::optional<double> componentSum;     ///< Метод A: сумма компонентов
    std::optional<double> navDelta;         ///< Метод B: изменение NAV
    bool discrepancy = false;               ///< Методы разошлись больше допуска
};

} // namespace navledger::domain
