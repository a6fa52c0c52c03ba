#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "domain/Money.hpp"
#include "ports/input/IDiscrepancyService.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief fix-discrepancies [--yes]
 *
 * Без --yes каждая корректировка подтверждается в терминале.
 * Код выхода 1 только при исчерпании итераций.
 */
class FixDiscrepanciesCommand : public ICliCommand {
public:
    explicit FixDiscrepanciesCommand(std::shared_ptr<ports::input::IDiscrepancyService> discrepancyService)
        : discrepancyService_(std::move(discrepancyService)) {}

    std::vector<std::string> names() const override { return {"fix-discrepancies"}; }

    std::string usage() const override { return "fix-discrepancies [--yes]"; }

    int execute(const CliArguments& args) override {
        auto result = discrepancyService_->correctDiscrepancies(args.hasFlag("--yes"));

        std::cout << "Status: " << domain::toString(result.status)
                  << ", corrections applied: " << result.correctionsApplied
                  << ", cycles: " << result.iterations << std::endl;
        for (const auto& correction : result.appliedCorrections) {
            std::cout << "  + " << correction.date << " "
                      << domain::formatMoney(correction.amount) << std::endl;
        }
        for (const auto& discrepancy : result.remaining) {
            std::cout << "  ! " << discrepancy.valuationDate << " expected "
                      << domain::formatMoney(discrepancy.expected) << ", recorded "
                      << domain::formatMoney(discrepancy.recorded) << std::endl;
        }
        return result.success ? 0 : 1;
    }

private:
    std::shared_ptr<ports::input::IDiscrepancyService> discrepancyService_;
};

} // namespace navledger::adapters::primary
