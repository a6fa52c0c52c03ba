#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/UsageError.hpp"
#include "domain/LedgerValidationError.hpp"
#include <iostream>
#include <memory>
#include <unordered_map>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Выбор команды по имени и перевод исключений в код выхода
 *
 * 0 - успех, 1 - ошибка выполнения, 2 - ошибка использования.
 */
class CliDispatcher {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURE_CODE = 1;
    static constexpr int EXIT_USAGE = 2;

    void registerCommand(std::shared_ptr<ICliCommand> command) {
        for (const auto& name : command->names()) {
            byName_[name] = command;
        }
        commands_.push_back(std::move(command));
    }

    int dispatch(const CliArguments& args) {
        if (args.command().empty() || args.command() == "help") {
            printUsage(std::cout);
            return args.command().empty() ? EXIT_USAGE : EXIT_OK;
        }

        auto it = byName_.find(args.command());
        if (it == byName_.end()) {
            std::cerr << "Unknown command: " << args.command() << std::endl;
            printUsage(std::cerr);
            return EXIT_USAGE;
        }

        try {
            return it->second->execute(args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n"
                      << "Usage: navledger " << it->second->usage() << std::endl;
            return EXIT_USAGE;
        } catch (const domain::LedgerValidationError& e) {
            std::cerr << "[CliDispatcher] Validation error: " << e.what() << std::endl;
            return EXIT_FAILURE_CODE;
        } catch (const std::exception& e) {
            std::cerr << "[CliDispatcher] Command '" << args.command() << "' failed: "
                      << e.what() << std::endl;
            return EXIT_FAILURE_CODE;
        }
    }

    void printUsage(std::ostream& out) const {
        out << "Usage: navledger <command> [args]\n\nCommands:\n";
        for (const auto& command : commands_) {
            out << "  " << command->usage() << "\n";
        }
        out << std::flush;
    }

private:
    std::vector<std::shared_ptr<ICliCommand>> commands_;
    std::unordered_map<std::string, std::shared_ptr<ICliCommand>> byName_;
};

} // namespace navledger::adapters::primary
