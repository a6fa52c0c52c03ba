#pragma once

#include <string>

namespace navledger::adapters::primary {

/**
 * @brief Вопрос пользователю с ответом да/нет
 */
class IUserPrompt {
public:
    virtual ~IUserPrompt() = default;
    virtual bool confirm(const std::string& question) = 0;
};

} // namespace navledger::adapters::primary
