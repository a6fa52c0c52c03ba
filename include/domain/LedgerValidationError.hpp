#pragma once

#include <stdexcept>
#include <string>

namespace navledger::domain {

/**
 * @brief Ошибка валидации входных данных леджера
 *
 * Невалидная дата, пустое имя таблицы, перевёрнутый диапазон отчёта.
 */
class LedgerValidationError : public std::invalid_argument {
public:
    explicit LedgerValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace navledger::domain
