#pragma once

#include "application/PnlReconciler.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IRecordService.hpp"
#include "ports/output/IBrokerRecordRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/IOtherTransactionRepository.hpp"
#include "ports/output/IValuationDateRepository.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace navledger::application {

/**
 * @brief Запись исходных данных и обслуживание таблиц
 *
 * Каждая изменяющая операция заканчивается полной пересборкой леджера.
 * Пакетные операции пересобирают леджер один раз в конце.
 *
 * P&L сверяется один раз, при записи выписки. Выписка за более раннюю
 * дату не пересверяет следующие записи: Starting Value выписки не
 * хранится, и неизвестно, брался ли Total Broker соседа.
 */
class RecordService : public ports::input::IRecordService {
public:
    RecordService(
        std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo,
        std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo,
        std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo,
        std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo,
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<PnlReconciler> reconciler
    ) : brokerRepo_(std::move(brokerRepo))
      , otherRepo_(std::move(otherRepo))
      , valuationRepo_(std::move(valuationRepo))
      , ledgerRepo_(std::move(ledgerRepo))
      , ledgerService_(std::move(ledgerService))
      , reconciler_(std::move(reconciler)) {}

    domain::BrokerDayRecord ingestBrokerStatement(const domain::BrokerStatement& statement) override {
        auto record = storeBrokerStatement(statement);
        refreshCumulativePnl();
        ledgerService_->rebuildLedger();
        return brokerRepo_->findByDate(record.date).value_or(record);
    }

    ports::input::ImportSummary ingestBrokerStatements(
        const std::vector<domain::BrokerStatement>& statements
    ) override {
        // Предыдущий Total Broker должен быть уже записан, поэтому по возрастанию даты
        std::vector<domain::BrokerStatement> ordered = statements;
        std::stable_sort(ordered.begin(), ordered.end(),
            [](const domain::BrokerStatement& a, const domain::BrokerStatement& b) {
                return domain::CalendarDate::parse(a.date).value_or(domain::CalendarDate())
                     < domain::CalendarDate::parse(b.date).value_or(domain::CalendarDate());
            });

        ports::input::ImportSummary summary;
        for (const auto& statement : ordered) {
            bool existed = brokerRepo_->findByDate(requireDate(statement.date)).has_value();
            storeBrokerStatement(statement);
            ++summary.processed;
            if (existed) {
                ++summary.updated;
            } else {
                ++summary.inserted;
            }
        }

        refreshCumulativePnl();
        ledgerService_->rebuildLedger();
        std::cout << "[RecordService] Broker statements processed: " << summary.processed
                  << " (inserted " << summary.inserted << ", updated " << summary.updated << ")"
                  << std::endl;
        return summary;
    }

    domain::SaveOutcome addOtherTransaction(const domain::OtherTransaction& transaction) override {
        auto outcome = storeOtherTransaction(transaction);
        ledgerService_->rebuildLedger();
        return outcome;
    }

    ports::input::ImportSummary addOtherTransactions(
        const std::vector<domain::OtherTransaction>& transactions
    ) override {
        ports::input::ImportSummary summary;
        for (const auto& transaction : transactions) {
            auto outcome = storeOtherTransaction(transaction);
            ++summary.processed;
            if (outcome == domain::SaveOutcome::INSERTED) {
                ++summary.inserted;
            } else {
                ++summary.updated;
            }
        }

        ledgerService_->rebuildLedger();
        std::cout << "[RecordService] Other transactions processed: " << summary.processed
                  << " (inserted " << summary.inserted << ", updated " << summary.updated << ")"
                  << std::endl;
        return summary;
    }

    domain::SaveOutcome addValuationDate(const std::string& date, std::optional<double> fundValue) override {
        auto outcome = storeValuationDate(date, fundValue);
        ledgerService_->rebuildLedger();
        return outcome;
    }

    ports::input::ImportSummary addValuationDates(
        const std::vector<domain::ValuationOverride>& valuations
    ) override {
        ports::input::ImportSummary summary;
        for (const auto& valuation : valuations) {
            auto outcome = storeValuationDate(valuation.date, valuation.fundValue);
            ++summary.processed;
            if (outcome == domain::SaveOutcome::INSERTED) {
                ++summary.inserted;
            } else {
                ++summary.updated;
            }
        }

        ledgerService_->rebuildLedger();
        std::cout << "[RecordService] Valuation dates processed: " << summary.processed
                  << " (inserted " << summary.inserted << ", updated " << summary.updated << ")"
                  << std::endl;
        return summary;
    }

    bool deleteValuationDate(const std::string& date) override {
        auto key = requireDate(date);
        if (!valuationRepo_->deleteByDate(key)) {
            std::cout << "[RecordService] Valuation date not found: " << key << std::endl;
            return false;
        }

        std::cout << "[RecordService] Valuation date deleted: " << key << std::endl;
        ledgerService_->rebuildLedger();
        return true;
    }

    std::vector<domain::ValuationOverride> listValuationDates() override {
        auto valuations = valuationRepo_->findAll();
        std::stable_sort(valuations.begin(), valuations.end(),
            [](const domain::ValuationOverride& a, const domain::ValuationOverride& b) {
                return domain::CalendarDate::parse(a.date).value_or(domain::CalendarDate())
                     < domain::CalendarDate::parse(b.date).value_or(domain::CalendarDate());
            });
        return valuations;
    }

    void clearTable(domain::LedgerTable table) override {
        switch (table) {
            case domain::LedgerTable::BROKER:
                brokerRepo_->deleteAll();
                break;
            case domain::LedgerTable::OTHER_TRANSACTIONS:
                otherRepo_->deleteAll();
                break;
            case domain::LedgerTable::VALUATION_DATES:
                valuationRepo_->deleteAll();
                break;
            case domain::LedgerTable::OVERALL:
                ledgerRepo_->deleteAll();
                std::cout << "[RecordService] Table cleared: overall" << std::endl;
                return;
        }

        std::cout << "[RecordService] Table cleared: " << domain::toString(table) << std::endl;
        ledgerService_->rebuildLedger();
    }

private:
    static std::string requireDate(const std::string& date) {
        auto normalized = domain::normalizeDate(date);
        if (!normalized) {
            throw domain::LedgerValidationError("Invalid date (expected MM/DD/YYYY): " + date);
        }
        return *normalized;
    }

    domain::BrokerDayRecord storeBrokerStatement(const domain::BrokerStatement& statement) {
        domain::BrokerStatement normalized = statement;
        normalized.date = requireDate(statement.date);

        auto reconciliation = reconciler_->reconcile(normalized, previousTotalBroker(normalized.date));
        reconciler_->checkAccruals(normalized);

        domain::BrokerDayRecord record;
        record.date = normalized.date;
        record.pnl = reconciliation.pnl;
        record.reportingError = reconciliation.reportingError;
        record.markToMarket = normalized.markToMarket;
        record.changeInDividendAccruals = normalized.changeInDividendAccruals;
        record.interest = normalized.interest;
        record.dividends = normalized.dividends;
        record.depositsWithdrawals = normalized.depositsWithdrawals;
        record.changeInInterestAccruals = normalized.changeInInterestAccruals;
        record.commissions = normalized.commissions;
        record.totalBroker = normalized.endingValue;

        brokerRepo_->upsert(record);
        return record;
    }

    std::optional<double> previousTotalBroker(const std::string& date) {
        auto current = domain::CalendarDate::parse(date);
        std::optional<domain::CalendarDate> latest;
        std::optional<double> totalBroker;

        for (const auto& record : brokerRepo_->findAll()) {
            auto recordDate = domain::CalendarDate::parse(record.date);
            if (!recordDate || !(*recordDate < *current)) {
                continue;
            }
            if (!latest || *latest < *recordDate) {
                latest = recordDate;
                totalBroker = record.totalBroker;
            }
        }
        return totalBroker;
    }

    /**
     * @brief Пересчитать Cumulative P&L по всем брокерским записям
     */
    void refreshCumulativePnl() {
        auto records = brokerRepo_->findAll();
        std::stable_sort(records.begin(), records.end(),
            [](const domain::BrokerDayRecord& a, const domain::BrokerDayRecord& b) {
                return domain::CalendarDate::parse(a.date).value_or(domain::CalendarDate())
                     < domain::CalendarDate::parse(b.date).value_or(domain::CalendarDate());
            });

        double running = 0.0;
        for (auto& record : records) {
            running += record.pnl.value_or(0.0);
            if (record.cumulativePnl != running) {
                record.cumulativePnl = running;
                brokerRepo_->upsert(record);
            }
        }
    }

    domain::SaveOutcome storeOtherTransaction(const domain::OtherTransaction& transaction) {
        domain::OtherTransaction normalized = transaction;
        normalized.date = requireDate(transaction.date);
        return otherRepo_->save(normalized);
    }

    domain::SaveOutcome storeValuationDate(const std::string& date, std::optional<double> fundValue) {
        auto key = requireDate(date);
        auto existing = valuationRepo_->findByDate(key);
        if (existing && !fundValue) {
            return domain::SaveOutcome::UPDATED;
        }

        valuationRepo_->upsert(domain::ValuationOverride{key, fundValue});
        return existing ? domain::SaveOutcome::UPDATED : domain::SaveOutcome::INSERTED;
    }

    std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo_;
    std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo_;
    std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo_;
    std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo_;
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<PnlReconciler> reconciler_;
};

} // namespace navledger::application
