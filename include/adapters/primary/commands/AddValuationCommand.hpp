#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "domain/Money.hpp"
#include "ports/input/IRecordService.hpp"
#include "utils/CsvParser.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief add-valuation <date> [value]
 */
class AddValuationCommand : public ICliCommand {
public:
    explicit AddValuationCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override { return {"add-valuation"}; }

    std::string usage() const override { return "add-valuation <date> [value]"; }

    int execute(const CliArguments& args) override {
        const auto& date = args.positional(0, "date");

        std::optional<double> fundValue;
        if (auto valueText = args.optionalPositional(1)) {
            fundValue = utils::CsvParser::parseAmount(*valueText);
            if (!fundValue) {
                throw UsageError("Invalid fund value: " + *valueText);
            }
        }

        auto outcome = recordService_->addValuationDate(date, fundValue);
        std::cout << (outcome == domain::SaveOutcome::INSERTED ? "Added" : "Updated")
                  << " valuation date " << date;
        if (fundValue) {
            std::cout << " (Fund Value: " << domain::formatMoney(*fundValue) << ")";
        }
        std::cout << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
