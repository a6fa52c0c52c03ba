#pragma once

#include "application/PeriodTracker.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/CorrectionResult.hpp"
#include "domain/Discrepancy.hpp"
#include "domain/Money.hpp"
#include "domain/OtherTransaction.hpp"
#include "ports/input/IDiscrepancyService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/ICorrectionDecider.hpp"
#include "ports/output/IOtherTransactionRepository.hpp"
#include "ports/output/IValuationDateRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include <iostream>
#include <memory>
#include <set>
#include <vector>

namespace navledger::application {

/**
 * @brief Поиск и исправление разрывов стоимости на датах оценки
 *
 * На дате оценки ожидаемая стартовая стоимость равна
 * End Fund Value + Overnight предыдущего дня. Если записанная стартовая
 * стоимость (из valuation_dates) отличается больше допуска, в
 * other_transactions на предыдущий день добавляется компенсирующая
 * ночная транзакция на сумму -delta, и леджер пересобирается.
 */
class DiscrepancyCorrector : public ports::input::IDiscrepancyService {
public:
    static constexpr const char* CORRECTION_ACCOUNT = "Correction";
    static constexpr const char* CORRECTION_DESCRIPTION = "Valuation Correction";
    static constexpr const char* CORRECTION_INFO = "Automatic correction for valuation discrepancy";

    DiscrepancyCorrector(
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo,
        std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo,
        std::shared_ptr<ports::output::ICorrectionDecider> decider,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : ledgerService_(std::move(ledgerService))
      , valuationRepo_(std::move(valuationRepo))
      , otherRepo_(std::move(otherRepo))
      , decider_(std::move(decider))
      , tolerance_(settings->getValuationTolerance())
      , maxIterations_(settings->getMaxCorrectionIterations()) {}

    std::vector<domain::Discrepancy> detectDiscrepancies() override {
        std::set<domain::CalendarDate> overrideDates;
        for (const auto& valuation : valuationRepo_->findAll()) {
            if (auto date = domain::CalendarDate::parse(valuation.date)) {
                overrideDates.insert(*date);
            }
        }
        return findDiscrepancies(ledgerService_->getLedger(), overrideDates, tolerance_);
    }

    domain::CorrectionResult correctDiscrepancies(bool autoConfirm) override {
        domain::CorrectionResult result;

        ledgerService_->rebuildLedger();

        while (result.iterations < maxIterations_) {
            ++result.iterations;

            auto found = detectDiscrepancies();
            if (found.empty()) {
                result.status = domain::CorrectionStatus::CONVERGED;
                std::cout << "[DiscrepancyCorrector] No discrepancies remain, corrections applied: "
                          << result.correctionsApplied << std::endl;
                return result;
            }

            const auto& discrepancy = found.front();
            auto correction = makeCorrection(discrepancy);
            std::cout << "[DiscrepancyCorrector] Discrepancy on " << discrepancy.valuationDate
                      << ": expected=" << domain::formatMoney(discrepancy.expected)
                      << " recorded=" << domain::formatMoney(discrepancy.recorded)
                      << " delta=" << domain::formatMoney(discrepancy.delta) << std::endl;

            bool approved = autoConfirm || decider_->confirm(discrepancy, correction);
            if (!approved) {
                std::cout << "[DiscrepancyCorrector] Correction declined for "
                          << discrepancy.valuationDate << std::endl;
                result.status = domain::CorrectionStatus::DECLINED;
                result.remaining = std::move(found);
                return result;
            }

            if (otherRepo_->save(correction) == domain::SaveOutcome::UPDATED) {
                std::cerr << "[DiscrepancyCorrector] WARNING correction already recorded"
                          << " date=" << correction.date
                          << " amount=" << correction.amount << std::endl;
                result.status = domain::CorrectionStatus::ALREADY_CORRECTED;
                result.remaining = std::move(found);
                return result;
            }

            std::cout << "[DiscrepancyCorrector] Applied correction on " << correction.date
                      << ": " << domain::formatMoney(correction.amount) << std::endl;
            ++result.correctionsApplied;
            result.appliedCorrections.push_back(correction);
            ledgerService_->rebuildLedger();
        }

        result.remaining = detectDiscrepancies();
        if (result.remaining.empty()) {
            result.status = domain::CorrectionStatus::CONVERGED;
            return result;
        }

        std::cerr << "[DiscrepancyCorrector] Maximum iterations reached (" << maxIterations_
                  << "), unresolved discrepancies: " << result.remaining.size() << std::endl;
        result.success = false;
        result.status = domain::CorrectionStatus::MAX_ITERATIONS_REACHED;
        return result;
    }

    /**
     * @brief Расхождения в упорядоченном леджере
     *
     * @param rows Строки леджера по возрастанию даты
     * @param overrideDates Даты из valuation_dates
     * @param tolerance Допуск по модулю delta
     */
    static std::vector<domain::Discrepancy> findDiscrepancies(
        const std::vector<domain::LedgerRow>& rows,
        const std::set<domain::CalendarDate>& overrideDates,
        double tolerance
    ) {
        std::vector<domain::CalendarDate> dates;
        dates.reserve(rows.size());
        for (const auto& row : rows) {
            dates.push_back(domain::CalendarDate::parse(row.date).value_or(domain::CalendarDate()));
        }
        auto valuationDates = PeriodTracker::valuationDates(dates, overrideDates);

        std::vector<domain::Discrepancy> found;
        for (std::size_t i = 1; i < rows.size(); ++i) {
            if (valuationDates.count(dates[i]) == 0) {
                continue;
            }

            const auto& previous = rows[i - 1];
            domain::Discrepancy discrepancy;
            discrepancy.valuationDate = rows[i].date;
            discrepancy.previousDate = previous.date;
            discrepancy.expected = previous.endFundValue + previous.overnight;
            discrepancy.recorded = rows[i].startFundValue;
            discrepancy.delta = discrepancy.expected - discrepancy.recorded;

            if (domain::exceedsTolerance(discrepancy.delta, tolerance)) {
                found.push_back(discrepancy);
            }
        }
        return found;
    }

    /**
     * @brief Компенсирующая транзакция для расхождения
     */
    static domain::OtherTransaction makeCorrection(const domain::Discrepancy& discrepancy) {
        return domain::OtherTransaction(
            discrepancy.previousDate,
            discrepancy.correctionAmount(),
            CORRECTION_ACCOUNT,
            CORRECTION_DESCRIPTION,
            false,
            true,
            CORRECTION_INFO
        );
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::output::IValuationDateRepository> valuationRepo_;
    std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo_;
    std::shared_ptr<ports::output::ICorrectionDecider> decider_;
    double tolerance_;
    int maxIterations_;
};

} // namespace navledger::application
