#pragma once

#include "Discrepancy.hpp"
#include "OtherTransaction.hpp"
#include "enums/CorrectionStatus.hpp"
#include <vector>

namespace navledger::domain {

/**
 * @brief Результат прогона DiscrepancyCorrector
 */
struct CorrectionResult {
    bool success = true;
    CorrectionStatus status = CorrectionStatus::CONVERGED;
    int correctionsApplied = 0;
    int iterations = 0;
    std::vector<OtherTransaction> appliedCorrections;
    std::vector<Discrepancy> remaining;     ///< Неразрешённые расхождения на момент остановки
};

} // namespace navledger::domain
