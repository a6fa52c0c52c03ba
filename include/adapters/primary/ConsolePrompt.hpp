#pragma once

#include "adapters/primary/IUserPrompt.hpp"
#include "utils/CsvParser.hpp"
#include <iostream>
#include <string>

namespace navledger::adapters::primary {

/**
 * @brief Вопрос в терминале, "(y/N)"; по умолчанию - нет
 */
class ConsolePrompt : public IUserPrompt {
public:
    bool confirm(const std::string& question) override {
        std::cout << question << " (y/N): " << std::flush;

        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        answer = utils::CsvParser::trim(answer);
        return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES" || answer == "Yes";
    }
};

} // namespace navledger::adapters::primary
