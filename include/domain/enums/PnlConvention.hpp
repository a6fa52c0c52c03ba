#pragma once

#include <stdexcept>
#include <string>

namespace navledger::domain {

/**
 * @brief Как проценты и дивиденды участвуют в двух методах расчёта P&L
 */
enum class PnlConvention {
    EXCLUDE_INTEREST_DIVIDENDS,     ///< A без Interest/Dividends, B = end - start - D&W - Interest - Dividends
    INCLUDE_INTEREST_DIVIDENDS      ///< A с Interest/Dividends, B = end - start - D&W
};

inline std::string toString(PnlConvention convention) {
    switch (convention) {
        case PnlConvention::EXCLUDE_INTEREST_DIVIDENDS: return "EXCLUDE_INTEREST_DIVIDENDS";
        case PnlConvention::INCLUDE_INTEREST_DIVIDENDS: return "INCLUDE_INTEREST_DIVIDENDS";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline PnlConvention pnlConventionFromString(const std::string& str) {
    if (str == "EXCLUDE_INTEREST_DIVIDENDS") return PnlConvention::EXCLUDE_INTEREST_DIVIDENDS;
    if (str == "INCLUDE_INTEREST_DIVIDENDS") return PnlConvention::INCLUDE_INTEREST_DIVIDENDS;
    throw std::invalid_argument("Unknown PnlConvention: " + str);
}

} // namespace navledger::domain
