#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "adapters/primary/csv/BrokerStatementCsvReader.hpp"
#include "domain/Money.hpp"
#include "ports/input/IRecordService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief load-broker <file> / load-broker-folder <dir>
 */
class LoadBrokerCommand : public ICliCommand {
public:
    explicit LoadBrokerCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override {
        return {"load-broker", "load-broker-folder"};
    }

    std::string usage() const override {
        return "load-broker <file> | load-broker-folder <dir>";
    }

    int execute(const CliArguments& args) override {
        if (args.command() == "load-broker-folder") {
            const auto& directory = args.positional(0, "dir");
            auto statements = BrokerStatementCsvReader::readFolder(directory);
            if (statements.empty()) {
                std::cerr << "No broker statements found in " << directory << std::endl;
                return 1;
            }

            auto summary = recordService_->ingestBrokerStatements(statements);
            std::cout << "Processed " << summary.processed << " broker statements ("
                      << summary.inserted << " new, " << summary.updated << " updated)" << std::endl;
            return 0;
        }

        auto statement = BrokerStatementCsvReader::readFile(args.positional(0, "file"));
        auto record = recordService_->ingestBrokerStatement(statement);
        std::cout << "Loaded broker statement for " << record.date;
        if (record.pnl) {
            std::cout << ": P&L " << domain::formatMoney(*record.pnl);
        } else {
            std::cout << ": P&L not computable";
        }
        if (record.reportingError > 0.0) {
            std::cout << ", reporting error " << domain::formatMoney(record.reportingError);
        }
        std::cout << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
