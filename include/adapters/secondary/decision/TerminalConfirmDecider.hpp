#pragma once

#include "domain/Money.hpp"
#include "ports/output/ICorrectionDecider.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace navledger::adapters::secondary {

/**
 * @brief Спрашивает подтверждение корректировки в терминале
 *
 * Принимает "y" или "yes" в любом регистре. Пустой ввод и конец потока
 * означают отказ.
 */
class TerminalConfirmDecider : public ports::output::ICorrectionDecider {
public:
    TerminalConfirmDecider() : in_(std::cin), out_(std::cout) {}

    TerminalConfirmDecider(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool confirm(const domain::Discrepancy& discrepancy,
                 const domain::OtherTransaction& proposal) override {
        out_ << "\nValuation Date: " << discrepancy.valuationDate << "\n"
             << "   Previous Day: " << discrepancy.previousDate << "\n"
             << "   Expected Start of Day Fund Value: " << domain::formatMoney(discrepancy.expected) << "\n"
             << "   Actual Start of Day Fund Value: " << domain::formatMoney(discrepancy.recorded) << "\n"
             << "   Discrepancy: " << domain::formatMoney(discrepancy.delta) << "\n"
             << "   Proposed Correction Transaction:\n"
             << "     Date: " << proposal.date << "\n"
             << "     Amount: " << domain::formatMoney(proposal.amount) << "\n"
             << "     Account Description: " << proposal.accountDescription << "\n"
             << "     Transaction Description: " << proposal.transactionDescription << "\n"
             << "     Counted in P&L: " << (proposal.countedInPnl ? "true" : "false") << "\n"
             << "     Overnight: " << (proposal.overnight ? "true" : "false") << "\n"
             << "\n   Add this correction transaction? (y/N): " << std::flush;

        std::string answer;
        if (!std::getline(in_, answer)) {
            return false;
        }

        answer.erase(std::remove_if(answer.begin(), answer.end(),
            [](unsigned char c) { return std::isspace(c); }), answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return answer == "y" || answer == "yes";
    }

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace navledger::adapters::secondary
