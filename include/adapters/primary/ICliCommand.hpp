#pragma once

#include "adapters/primary/CliArguments.hpp"
#include <string>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Команда командной строки
 */
class ICliCommand {
public:
    virtual ~ICliCommand() = default;

    /**
     * @brief Имена, под которыми команда вызывается
     */
    virtual std::vector<std::string> names() const = 0;

    /**
     * @brief Строка помощи: "load-broker <file>"
     */
    virtual std::string usage() const = 0;

    /**
     * @brief Выполнить команду
     *
     * @return Код выхода процесса
     * @throws UsageError при неверных аргументах
     */
    virtual int execute(const CliArguments& args) = 0;
};

} // namespace navledger::adapters::primary
