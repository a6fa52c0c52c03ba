#pragma once

#include "domain/LedgerReport.hpp"
#include "domain/LedgerRow.hpp"
#include "domain/PeriodReturn.hpp"
#include <string>
#include <vector>

namespace navledger::ports::input {

/**
 * @brief Интерфейс отчётов по леджеру
 *
 * Input Port.
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    /**
     * @brief Собрать отчёт за диапазон дат (включительно)
     *
     * @throws domain::LedgerValidationError при невалидной дате или from > to
     */
    virtual domain::LedgerReport buildReport(const std::string& from, const std::string& to) = 0;

    /**
     * @brief Сводка доходности по периодам оценки
     */
    virtual std::vector<domain::PeriodReturn> periodReturns(const std::vector<domain::LedgerRow>& rows) = 0;
};

} // namespace navledger::ports::input
