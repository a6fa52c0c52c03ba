#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "domain/Money.hpp"
#include "ports/input/IRecordService.hpp"
#include "utils/CsvParser.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief add-other <date> <amount> <account> <description> [--pnl] [--overnight] [--info TEXT]
 */
class AddOtherCommand : public ICliCommand {
public:
    explicit AddOtherCommand(std::shared_ptr<ports::input::IRecordService> recordService)
        : recordService_(std::move(recordService)) {}

    std::vector<std::string> names() const override { return {"add-other"}; }

    std::string usage() const override {
        return "add-other <date> <amount> <account> <description> [--pnl] [--overnight] [--info TEXT]";
    }

    int execute(const CliArguments& args) override {
        const auto& date = args.positional(0, "date");
        const auto& amountText = args.positional(1, "amount");
        auto amount = utils::CsvParser::parseAmount(amountText);
        if (!amount) {
            throw UsageError("Invalid amount: " + amountText);
        }

        domain::OtherTransaction transaction(
            date,
            *amount,
            args.positional(2, "account"),
            args.positional(3, "description"),
            args.hasFlag("--pnl"),
            args.hasFlag("--overnight"),
            args.option("--info").value_or("")
        );

        auto outcome = recordService_->addOtherTransaction(transaction);
        std::cout << (outcome == domain::SaveOutcome::INSERTED ? "Added" : "Updated")
                  << " transaction on " << transaction.date << ": "
                  << domain::formatMoney(transaction.amount) << " ("
                  << transaction.accountDescription << " / "
                  << transaction.transactionDescription << ")" << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::IRecordService> recordService_;
};

} // namespace navledger::adapters::primary
