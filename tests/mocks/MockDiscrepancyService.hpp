#pragma once

#include "ports/input/IDiscrepancyService.hpp"
#include <gmock/gmock.h>

namespace navledger::tests {

class MockDiscrepancyService : public ports::input::IDiscrepancyService {
public:
    MOCK_METHOD(std::vector<domain::Discrepancy>, detectDiscrepancies, (), (override));
    MOCK_METHOD(domain::CorrectionResult, correctDiscrepancies, (bool), (override));
};

} // namespace navledger::tests
