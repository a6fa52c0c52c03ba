#pragma once

#include "application/LedgerBuilder.hpp"
#include "domain/CalendarDate.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IBrokerRecordRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/IOtherTransactionRepository.hpp"
#include "ports/output/IValuationDateRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace navledger::application {

/**
 * @brief Пересборка таблицы overall из трёх исходных таблиц
 *
 * Полный пересчёт на каждый вызов: прочитать broker, other_transactions,
 * valuation_dates, собрать леджер и заменить overall целиком.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo,
        std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo,
        std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo,
        std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : brokerRepo_(std::move(brokerRepo))
      , otherRepo_(std::move(otherRepo))
      , valuationRepo_(std::move(valuationRepo))
      , ledgerRepo_(std::move(ledgerRepo))
      , builder_(settings->getRunningTotalEpoch()) {}

    std::size_t rebuildLedger() override {
        LedgerInputs inputs;
        inputs.brokerRecords = brokerRepo_->findAll();
        inputs.otherTransactions = otherRepo_->findAll();
        inputs.valuationOverrides = valuationRepo_->findAll();

        auto rows = builder_.build(inputs);
        ledgerRepo_->replaceAll(rows);

        std::cout << "[LedgerService] Ledger rebuilt: " << rows.size() << " rows" << std::endl;
        return rows.size();
    }

    /**
     * @brief Строки леджера в хронологическом порядке
     */
    std::vector<domain::LedgerRow> getLedger() override {
        auto rows = ledgerRepo_->findAll();
        std::stable_sort(rows.begin(), rows.end(),
            [](const domain::LedgerRow& a, const domain::LedgerRow& b) {
                return domain::CalendarDate::parse(a.date).value_or(domain::CalendarDate())
                     < domain::CalendarDate::parse(b.date).value_or(domain::CalendarDate());
            });
        return rows;
    }

private:
    std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo_;
    std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo_;
    std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo_;
    std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo_;
    LedgerBuilder builder_;
};

} // namespace navledger::application
