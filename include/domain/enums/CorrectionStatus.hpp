#pragma once

#include <string>

namespace navledger::domain {

/**
 * @brief Чем закончился цикл исправления расхождений
 */
enum class CorrectionStatus {
    CONVERGED,              ///< Расхождений не осталось
    DECLINED,               ///< Пользователь отклонил предложенную корректировку
    ALREADY_CORRECTED,      ///< Такая корректировка уже есть в other_transactions
    MAX_ITERATIONS_REACHED  ///< Достигнут предел итераций
};

inline std::string toString(CorrectionStatus status) {
    switch (status) {
        case CorrectionStatus::CONVERGED:              return "CONVERGED";
        case CorrectionStatus::DECLINED:               return "DECLINED";
        case CorrectionStatus::ALREADY_CORRECTED:      return "ALREADY_CORRECTED";
        case CorrectionStatus::MAX_ITERATIONS_REACHED: return "MAX_ITERATIONS_REACHED";
    }
    return "UNKNOWN";
}

} // namespace navledger::domain
