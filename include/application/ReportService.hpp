#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "domain/Money.hpp"
#include "domain/enums/PnlConvention.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IReportService.hpp"
#include "ports/output/IBrokerRecordRepository.hpp"
#include "ports/output/IOtherTransactionRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace navledger::application {

/**
 * @brief Выборка данных для отчёта за диапазон дат
 *
 * Отчёт содержит строки леджера, брокерские записи и прочие транзакции
 * в диапазоне [from, to], сводку по периодам оценки и проверку
 * брокерского P&L по формуле изменения Total Broker.
 */
class ReportService : public ports::input::IReportService {
public:
    ReportService(
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo,
        std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : ledgerService_(std::move(ledgerService))
      , brokerRepo_(std::move(brokerRepo))
      , otherRepo_(std::move(otherRepo))
      , tolerance_(settings->getPnlTolerance())
      , convention_(settings->getPnlConvention()) {}

    domain::LedgerReport buildReport(const std::string& from, const std::string& to) override {
        auto fromDate = domain::CalendarDate::parse(from);
        auto toDate = domain::CalendarDate::parse(to);
        if (!fromDate || !toDate) {
            throw domain::LedgerValidationError("Invalid report range: " + from + " - " + to);
        }
        if (*toDate < *fromDate) {
            throw domain::LedgerValidationError("Report start date is after end date: " + from + " > " + to);
        }

        auto inRange = [&](const std::string& date) {
            auto parsed = domain::CalendarDate::parse(date);
            return parsed && *fromDate <= *parsed && *parsed <= *toDate;
        };
        auto byDate = [](const std::string& a, const std::string& b) {
            return domain::CalendarDate::parse(a).value_or(domain::CalendarDate())
                 < domain::CalendarDate::parse(b).value_or(domain::CalendarDate());
        };

        domain::LedgerReport report;
        report.fromDate = fromDate->toString();
        report.toDate = toDate->toString();

        for (auto& row : ledgerService_->getLedger()) {
            if (inRange(row.date)) {
                report.overall.push_back(std::move(row));
            }
        }

        for (auto& record : brokerRepo_->findAll()) {
            if (inRange(record.date)) {
                report.broker.push_back(std::move(record));
            }
        }
        std::stable_sort(report.broker.begin(), report.broker.end(),
            [&](const domain::BrokerDayRecord& a, const domain::BrokerDayRecord& b) {
                return byDate(a.date, b.date);
            });

        for (auto& transaction : otherRepo_->findAll()) {
            if (inRange(transaction.date)) {
                report.otherTransactions.push_back(std::move(transaction));
            }
        }
        std::stable_sort(report.otherTransactions.begin(), report.otherTransactions.end(),
            [&](const domain::OtherTransaction& a, const domain::OtherTransaction& b) {
                return byDate(a.date, b.date);
            });

        report.periodReturns = periodReturns(report.overall);
        report.pnlCheck = checkBrokerPnl(report.broker);

        std::cout << "[ReportService] Report " << report.fromDate << " - " << report.toDate
                  << ": " << report.overall.size() << " ledger rows, "
                  << report.periodReturns.size() << " periods, "
                  << report.pnlCheck.size() << " P&L mismatches" << std::endl;
        return report;
    }

    /**
     * @brief Сводка по периодам оценки
     *
     * Строки до первой даты оценки не входят ни в один период. Период,
     * начавшийся до первой строки диапазона, начинается с неё, а его
     * накопленный P&L считается от настоящего начала периода.
     *
     * @param rows Строки леджера по возрастанию даты
     */
    std::vector<domain::PeriodReturn> periodReturns(const std::vector<domain::LedgerRow>& rows) override {
        std::vector<domain::PeriodReturn> periods;

        for (const auto& row : rows) {
            if (!row.periodStartingNav) {
                continue;
            }
            if (row.valuationDate || periods.empty()) {
                domain::PeriodReturn period;
                period.startDate = row.date;
                period.startingNav = *row.periodStartingNav;
                periods.push_back(period);
            }

            auto& period = periods.back();
            period.endDate = row.date;
            ++period.days;
            period.cumulativePnl = row.periodCumulativePnl.value_or(0.0);
            period.endingValue = period.startingNav + period.cumulativePnl;
            period.cumulativeReturn = row.periodCumulativeReturn;
        }

        return periods;
    }

private:
    /**
     * @brief P&L = Total Broker - предыдущий Total Broker - D&W [- Dividends - Interest]
     *
     * Interest и Dividends вычитаются только при EXCLUDE_INTEREST_DIVIDENDS:
     * при INCLUDE_INTEREST_DIVIDENDS они уже входят в сохранённый P&L.
     */
    std::vector<domain::PnlFormulaMismatch> checkBrokerPnl(
        const std::vector<domain::BrokerDayRecord>& records
    ) const {
        std::vector<domain::PnlFormulaMismatch> mismatches;

        for (std::size_t i = 1; i < records.size(); ++i) {
            const auto& current = records[i];
            const auto& previous = records[i - 1];

            domain::PnlFormulaMismatch mismatch;
            mismatch.date = current.date;
            mismatch.storedPnl = current.pnl;
            mismatch.formulaPnl = current.totalBroker.value_or(0.0)
                                - previous.totalBroker.value_or(0.0)
                                - current.depositsWithdrawals.value_or(0.0);
            if (convention_ == domain::PnlConvention::EXCLUDE_INTEREST_DIVIDENDS) {
                mismatch.formulaPnl -= current.dividends.value_or(0.0) + current.interest.value_or(0.0);
            }

            if (!current.pnl) {
                mismatch.difference = mismatch.formulaPnl;
            } else {
                mismatch.difference = mismatch.formulaPnl - *current.pnl;
                if (!domain::exceedsTolerance(mismatch.difference, tolerance_)) {
                    continue;
                }
            }

            std::cerr << "[ReportService] WARNING broker P&L formula mismatch"
                      << " date=" << mismatch.date
                      << " stored=" << (current.pnl ? std::to_string(*current.pnl) : std::string("null"))
                      << " formula=" << mismatch.formulaPnl
                      << " difference=" << mismatch.difference << std::endl;
            mismatches.push_back(mismatch);
        }

        return mismatches;
    }

    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::output::IBrokerRecordRepository> brokerRepo_;
    std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo_;
    double tolerance_;
    domain::PnlConvention convention_;
};

} // namespace navledger::application
