#pragma once

#include <pqxx/pqxx>
#include <optional>

namespace navledger::adapters::secondary {

/**
 * @brief NULL-совместимое чтение REAL/DOUBLE PRECISION колонки
 */
inline std::optional<double> optionalDouble(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<double>();
}

} // namespace navledger::adapters::secondary
