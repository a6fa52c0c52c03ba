#pragma once

#include "domain/Discrepancy.hpp"
#include "domain/OtherTransaction.hpp"

namespace navledger::ports::output {

/**
 * @brief Решение по предложенной корректировке
 *
 * Output Port. Единственная точка блокирующего ожидания в цикле
 * исправления: интерактивный запрос или автоподтверждение.
 */
class ICorrectionDecider {
public:
    virtual ~ICorrectionDecider() = default;

    /**
     * @brief Подтвердить корректировку
     *
     * @param discrepancy Найденное расхождение
     * @param proposal Компенсирующая транзакция, которая будет записана
     * @return true если корректировку нужно применить
     */
    virtual bool confirm(const domain::Discrepancy& discrepancy,
                         const domain::OtherTransaction& proposal) = 0;
};

} // namespace navledger::ports::output
