#pragma once

#include "ports/output/ICorrectionDecider.hpp"
#include <iostream>

namespace navledger::adapters::secondary {

/**
 * @brief Подтверждает любую корректировку (флаг --yes)
 */
class AutoConfirmDecider : public ports::output::ICorrectionDecider {
public:
    bool confirm(const domain::Discrepancy& discrepancy,
                 const domain::OtherTransaction& proposal) override {
        std::cout << "[AutoConfirmDecider] Accepting correction for " << discrepancy.valuationDate
                  << " on " << proposal.date << std::endl;
        return true;
    }
};

} // namespace navledger::adapters::secondary
