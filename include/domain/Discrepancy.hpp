#pragma once

#include <string>

namespace navledger::domain {

/**
 * @brief Расхождение стартовой стоимости фонда на дату оценки
 *
 * expected - перенос с предыдущего дня (End Fund Value + Overnight),
 * recorded - стартовая стоимость, записанная в леджере на дату оценки.
 */
struct Discrepancy {
    std::string valuationDate;
    std::string previousDate;
    double expected = 0.0;
    double recorded = 0.0;
    double delta = 0.0;     ///< expected - recorded

    /**
     * @brief Сумма компенсирующей транзакции
     *
     * Транзакция датируется previousDate и помечается overnight, поэтому
     * сдвигает перенос на следующий день ровно на эту сумму.
     */
    double correctionAmount() const {
        return -delta;
    }
};

} // namespace navledger::domain
