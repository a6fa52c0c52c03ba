#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "domain/Money.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief list-valuations
 */
class ListValuationsCommand : public ICliCommand {
public:
    explicit ListValuationsCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override { return {"list-valuations"}; }

    std::string usage() const override { return "list-valuations"; }

    int execute(const CliArguments&) override {
        auto valuations = recordService_->listValuationDates();
        if (valuations.empty()) {
            std::cout << "No valuation dates found." << std::endl;
            return 0;
        }

        std::cout << "Valuation dates (" << valuations.size() << "):" << std::endl;
        for (const auto& valuation : valuations) {
            std::cout << "  - " << valuation.date;
            if (valuation.fundValue) {
                std::cout << " (Fund Value: " << domain::formatMoney(*valuation.fundValue) << ")";
            } else {
                std::cout << " (no fund value)";
            }
            std::cout << std::endl;
        }
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
