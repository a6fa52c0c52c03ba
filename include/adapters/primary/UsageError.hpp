#pragma once

#include <stdexcept>
#include <string>

namespace navledger::adapters::primary {

/**
 * @brief Неверные аргументы командной строки (код выхода 2)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace navledger::adapters::primary
