#pragma once

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace navledger::domain {

/**
 * @brief Округлить сумму до центов
 */
inline double roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

/**
 * @brief Превышает ли расхождение допуск
 *
 * Сравнение идёт по значениям, округлённым до центов: расхождение,
 * в точности равное допуску, допуск не превышает. Доля цента сверх
 * допуска тоже не считается (0.104 при допуске 0.10).
 */
inline bool exceedsTolerance(double difference, double tolerance) {
    return std::llround(std::fabs(difference) * 100.0) > std::llround(tolerance * 100.0);
}

/**
 * @brief Форматировать сумму для консоли: $1,234.56 / -$1,234.56
 */
inline std::string formatMoney(double value) {
    auto cents = std::llround(std::fabs(value) * 100.0);
    std::string whole = std::to_string(cents / 100);
    for (int pos = static_cast<int>(whole.size()) - 3; pos > 0; pos -= 3) {
        whole.insert(static_cast<size_t>(pos), ",");
    }
    std::ostringstream ss;
    if (value < 0 && cents != 0) {
        ss << '-';
    }
    ss << '$' << whole << '.' << std::setw(2) << std::setfill('0') << (cents % 100);
    return ss.str();
}

} // namespace navledger::domain
