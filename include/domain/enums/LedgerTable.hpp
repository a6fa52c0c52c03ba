#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Таблицы хранилища
 */
enum class LedgerTable {
    BROKER,
    OTHER_TRANSACTIONS,
    VALUATION_DATES,
    OVERALL
};

inline std::string toString(LedgerTable table) {
    switch (table) {
        case LedgerTable::BROKER:             return "broker";
        case LedgerTable::OTHER_TRANSACTIONS: return "other_transactions";
        case LedgerTable::VALUATION_DATES:    return "valuation_dates";
        case LedgerTable::OVERALL:            return "overall";
    }
    return "unknown";
}

inline std::optional<LedgerTable> ledgerTableFromString(const std::string& str) {
    if (str == "broker")             return LedgerTable::BROKER;
    if (str == "other_transactions") return LedgerTable::OTHER_TRANSACTIONS;
    if (str == "valuation_dates")    return LedgerTable::VALUATION_DATES;
    if (str == "overall")            return LedgerTable::OVERALL;
    return std::nullopt;
}

} // namespace navledger::domain
