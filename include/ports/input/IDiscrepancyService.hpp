#pragma once

#include "domain/CorrectionResult.hpp"
#include "domain/Discrepancy.hpp"
#include <vector>

namespace navledger::ports::input {

/**
 * @brief Интерфейс поиска и исправления расхождений на датах оценки
 *
 * Input Port.
 */
class IDiscrepancyService {
public:
    virtual ~IDiscrepancyService() = default;

    /**
     * @brief Найти расхождения в текущем леджере
     *
     * @return Расхождения в хронологическом порядке дат оценки
     */
    virtual std::vector<domain::Discrepancy> detectDiscrepancies() = 0;

    /**
     * @brief Цикл detect → propose → decide → apply → rebuild до неподвижной точки
     *
     * @param autoConfirm true - подтверждать все корректировки без запроса
     * @return Итог прогона
     */
    virtual domain::CorrectionResult correctDiscrepancies(bool autoConfirm) = 0;
};

} // namespace navledger::ports::input
