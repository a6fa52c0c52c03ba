#pragma once

#include "ports/input/IRecordService.hpp"
#include <gmock/gmock.h>

namespace navledger::tests {

class MockRecordService : public ports::input::IRecordService {
public:
    MOCK_METHOD(domain::BrokerDayRecord, ingestBrokerStatement, (const domain::BrokerStatement&), (override));
    MOCK_METHOD(ports::input::ImportSummary, ingestBrokerStatements,
                (const std::vector<domain::BrokerStatement>&), (override));
    MOCK_METHOD(domain::SaveOutcome, addOtherTransaction, (const domain::OtherTransaction&), (override));
    MOCK_METHOD(ports::input::ImportSummary, addOtherTransactions,
                (const std::vector<domain::OtherTransaction>&), (override));
    MOCK_METHOD(domain::SaveOutcome, addValuationDate, (const std::string&, std::optional<double>), (override));
    MOCK_METHOD(ports::input::ImportSummary, addValuationDates,
                (const std::vector<domain::ValuationOverride>&), (override));
    MOCK_METHOD(bool, deleteValuationDate, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::ValuationOverride>, listValuationDates, (), (override));
    MOCK_METHOD(void, clearTable, (domain::LedgerTable), (override));
};

} // namespace navledger::tests
