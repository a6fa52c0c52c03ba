#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/IUserPrompt.hpp"
#include "domain/enums/LedgerTable.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief clear-table <broker|other_transactions|valuation_dates|overall> [--force]
 */
class ClearTableCommand : public ICliCommand {
public:
    ClearTableCommand(
        std::shared_ptr<ports::input::IRecordService> recordService,
        std::shared_ptr<IUserPrompt> prompt
    ) : recordService_(std::move(recordService))
      , prompt_(std::move(prompt)) {}

    std::vector<std::string> names() const override { return {"clear-table"}; }

    std::string usage() const override {
        return "clear-table <broker|other_transactions|valuation_dates|overall> [--force]";
    }

    int execute(const CliArguments& args) override {
        const auto& name = args.positional(0, "table");
        auto table = domain::ledgerTableFromString(name);
        if (!table) {
            throw UsageError("Unknown table: " + name);
        }

        if (!args.hasFlag("--force") &&
            !prompt_->confirm("Are you sure you want to delete the '" + name
                              + "' table? This action cannot be undone.")) {
            std::cout << "Operation cancelled." << std::endl;
            return 0;
        }

        recordService_->clearTable(*table);
        std::cout << "Table '" << name << "' cleared" << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
    std::shared_ptr<IUserPrompt> prompt_;
};

} // namespace navledger::adapters::primary
