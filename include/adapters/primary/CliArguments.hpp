#pragma once

#include "adapters/primary/UsageError.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Разобранная командная строка: navledger <command> [args] [--flags]
 *
 * "--name" - флаг; "--info" и "--output" забирают следующий аргумент как
 * значение. Всё остальное (включая "-500") - позиционные аргументы.
 */
class CliArguments {
public:
    CliArguments(int argc, char* argv[])
        : CliArguments(std::vector<std::string>(argv + std::min(argc, 1), argv + argc)) {}

    /**
     * @param tokens Аргументы без имени программы
     */
    explicit CliArguments(const std::vector<std::string>& tokens) {
        static const std::set<std::string> VALUE_OPTIONS = {"--info", "--output"};

        for (size_t i = 0; i < tokens.size(); ++i) {
            const auto& token = tokens[i];
            if (token.rfind("--", 0) != 0 || token.size() == 2) {
                if (command_.empty()) {
                    command_ = token;
                } else {
                    positionals_.push_back(token);
                }
                continue;
            }

            if (VALUE_OPTIONS.count(token)) {
                if (i + 1 >= tokens.size()) {
                    throw UsageError("Option " + token + " requires a value");
                }
                options_[token] = tokens[++i];
            } else {
                flags_.insert(token);
            }
        }
    }

    const std::string& command() const { return command_; }

    size_t positionalCount() const { return positionals_.size(); }

    /**
     * @brief Обязательный позиционный аргумент
     *
     * @param what Имя аргумента для сообщения об ошибке
     * @throws UsageError если аргумента нет
     */
    const std::string& positional(size_t index, const std::string& what) const {
        if (index >= positionals_.size()) {
            throw UsageError("Missing argument <" + what + ">");
        }
        return positionals_[index];
    }

    std::optional<std::string> optionalPositional(size_t index) const {
        if (index >= positionals_.size()) {
            return std::nullopt;
        }
        return positionals_[index];
    }

    bool hasFlag(const std::string& flag) const {
        return flags_.count(flag) > 0;
    }

    std::optional<std::string> option(const std::string& name) const {
        auto it = options_.find(name);
        if (it == options_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::string command_;
    std::vector<std::string> positionals_;
    std::set<std::string> flags_;
    std::unordered_map<std::string, std::string> options_;
};

} // namespace navledger::adapters::primary
