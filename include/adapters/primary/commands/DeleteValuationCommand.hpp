#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/IUserPrompt.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "domain/Money.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief delete-valuation <date> [--force]
 */
class DeleteValuationCommand : public ICliCommand {
public:
    DeleteValuationCommand(
        std::shared_ptr<ports::input::IRecordService> recordService,
        std::shared_ptr<IUserPrompt> prompt
    ) : recordService_(std::move(recordService))
      , prompt_(std::move(prompt)) {}

    std::vector<std::string> names() const override { return {"delete-valuation"}; }

    std::string usage() const override { return "delete-valuation <date> [--force]"; }

    int execute(const CliArguments& args) override {
        const auto& date = args.positional(0, "date");
        auto key = domain::normalizeDate(date);
        if (!key) {
            throw domain::LedgerValidationError("Invalid date (expected MM/DD/YYYY): " + date);
        }

        if (!args.hasFlag("--force")) {
            std::string valueText;
            for (const auto& valuation : recordService_->listValuationDates()) {
                if (valuation.date == *key && valuation.fundValue) {
                    valueText = " (Fund Value: " + domain::formatMoney(*valuation.fundValue) + ")";
                }
            }
            if (!prompt_->confirm("Are you sure you want to delete the valuation date '" + *key + "'"
                                  + valueText + "? This action cannot be undone.")) {
                std::cout << "Operation cancelled." << std::endl;
                return 0;
            }
        }

        if (!recordService_->deleteValuationDate(*key)) {
            std::cerr << "Valuation date " << *key << " not found" << std::endl;
            return 1;
        }
        std::cout << "Deleted valuation date " << *key << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
    std::shared_ptr<IUserPrompt> prompt_;
};

} // namespace navledger::adapters::primary
