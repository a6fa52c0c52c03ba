#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/csv/OtherTransactionsCsvReader.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief load-other <file> / load-other-folder <dir>
 */
class LoadOtherCommand : public ICliCommand {
public:
    explicit LoadOtherCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override {
        return {"load-other", "load-other-folder"};
    }

    std::string usage() const override {
        return "load-other <file> | load-other-folder <dir>";
    }

    int execute(const CliArguments& args) override {
        std::vector<domain::OtherTransaction> transactions;
        if (args.command() == "load-other-folder") {
            transactions = OtherTransactionsCsvReader::readFolder(args.positional(0, "dir"));
        } else {
            transactions = OtherTransactionsCsvReader::readFile(args.positional(0, "file"));
        }

        if (transactions.empty()) {
            std::cerr << "No valid transactions found" << std::endl;
            return 1;
        }

        auto summary = recordService_->addOtherTransactions(transactions);
        std::cout << "Processed " << summary.processed << " transactions ("
                  << summary.inserted << " new, " << summary.updated << " updated)" << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
