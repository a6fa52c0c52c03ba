#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/csv/ValuationCsvReader.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief load-valuation <file>
 */
class LoadValuationCommand : public ICliCommand {
public:
    explicit LoadValuationCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override { return {"load-valuation"}; }

    std::string usage() const override { return "load-valuation <file>"; }

    int execute(const CliArguments& args) override {
        auto valuations = ValuationCsvReader::readFile(args.positional(0, "file"));
        if (valuations.empty()) {
            std::cerr << "No valid valuation dates found" << std::endl;
            return 1;
        }

        auto summary = recordService_->addValuationDates(valuations);
        std::cout << "Processed " << summary.processed << " valuation dates ("
                  << summary.inserted << " new, " << summary.updated << " updated)" << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
