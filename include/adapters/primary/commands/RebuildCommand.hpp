#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "ports/input/ILedgerService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief rebuild
 */
class RebuildCommand : public ICliCommand {
public:
    explicit RebuildCommand(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService)) {}

    std::vector<std::string> names() const override { return {"rebuild"}; }

    std::string usage() const override { return "rebuild"; }

    int execute(const CliArguments&) override {
        auto rows = ledgerService_->rebuildLedger();
        std::cout << "Ledger rebuilt: " << rows << " rows" << std::endl;
        return 0;
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
};

} // namespace navledger::adapters::primary
