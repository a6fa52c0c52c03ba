#include "application/LedgerBuilder.hpp"
#include "application/PeriodTracker.hpp"

#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace navledger::application {

namespace {

struct DayTotals {
    double all = 0.0;         // все прочие транзакции дня
    double countedInPnl = 0.0;
    double overnight = 0.0;
};

std::optional<double> ratio(double numerator, std::optional<double> denominator) {
    if (!denominator || *denominator == 0.0) {
        return std::nullopt;
    }
    return numerator / *denominator;
}

} // namespace

std::vector<domain::LedgerRow> LedgerBuilder::build(const LedgerInputs& inputs) const {
    std::map<domain::CalendarDate, const domain::BrokerDayRecord*> broker;
    for (const auto& record : inputs.brokerRecords) {
        auto date = domain::CalendarDate::parse(record.date);
        if (!date) {
            std::cerr << "[LedgerBuilder] WARNING skipping broker record: invalid date=\""
                      << record.date << "\"" << std::endl;
            continue;
        }
        if (!broker.emplace(*date, &record).second) {
            std::cerr << "[LedgerBuilder] WARNING duplicate broker record date="
                      << date->toString() << ", keeping the last one" << std::endl;
            broker[*date] = &record;
        }
    }

    if (broker.empty()) {
        std::cout << "[LedgerBuilder] No broker data, ledger is empty" << std::endl;
        return {};
    }

    std::map<domain::CalendarDate, DayTotals> other;
    for (const auto& tx : inputs.otherTransactions) {
        auto date = domain::CalendarDate::parse(tx.date);
        if (!date) {
            std::cerr << "[LedgerBuilder] WARNING skipping other transaction: invalid date=\""
                      << tx.date << "\" amount=" << tx.amount << std::endl;
            continue;
        }
        auto& totals = other[*date];
        totals.all += tx.amount;
        if (tx.countedInPnl) {
            totals.countedInPnl += tx.amount;
        }
        if (tx.overnight) {
            totals.overnight += tx.amount;
        }
    }

    std::map<domain::CalendarDate, std::optional<double>> overrides;
    std::set<domain::CalendarDate> overrideDates;
    for (const auto& valuation : inputs.valuationOverrides) {
        auto date = domain::CalendarDate::parse(valuation.date);
        if (!date) {
            std::cerr << "[LedgerBuilder] WARNING skipping valuation date: invalid date=\""
                      << valuation.date << "\"" << std::endl;
            continue;
        }
        overrides[*date] = valuation.fundValue;
        overrideDates.insert(*date);
    }

    std::set<domain::CalendarDate> dateSet;
    for (const auto& entry : broker) dateSet.insert(entry.first);
    for (const auto& entry : other) dateSet.insert(entry.first);
    std::vector<domain::CalendarDate> dates(dateSet.begin(), dateSet.end());

    const auto valuationDates = PeriodTracker::valuationDates(dates, overrideDates);

    std::vector<domain::LedgerRow> rows;
    rows.reserve(dates.size());

    double runningOtherTotal = 0.0;
    std::optional<double> periodStartingNav;
    double cumulativePnlSincePeriodStart = 0.0;
    std::optional<double> previousEndFundValue;
    double previousOvernight = 0.0;

    for (const auto& date : dates) {
        const domain::BrokerDayRecord* record = nullptr;
        if (auto it = broker.find(date); it != broker.end()) {
            record = it->second;
        }
        DayTotals totals;
        if (auto it = other.find(date); it != other.end()) {
            totals = it->second;
        }

        if (runningTotalEpoch_ && date == *runningTotalEpoch_) {
            runningOtherTotal = 0.0;
        }
        runningOtherTotal += totals.all;

        domain::LedgerRow row;
        row.date = date.toString();
        row.brokerPnl = record ? record->pnl : std::nullopt;
        row.totalBroker = record ? record->totalBroker : std::nullopt;
        row.otherPnl = totals.countedInPnl;
        row.totalOther = runningOtherTotal;
        row.overnight = totals.overnight;
        row.totalPnl = row.brokerPnl.value_or(0.0) + row.otherPnl;
        row.endFundValue = row.totalBroker.value_or(0.0) + row.totalOther - row.overnight;

        auto overrideIt = overrides.find(date);
        if (overrideIt != overrides.end() && overrideIt->second) {
            row.startFundValue = *overrideIt->second;
        } else if (previousEndFundValue) {
            row.startFundValue = *previousEndFundValue + previousOvernight;
        } else {
            row.startFundValue = row.endFundValue;
        }

        row.valuationDate = valuationDates.count(date) > 0;
        if (row.valuationDate) {
            periodStartingNav = row.startFundValue;
            cumulativePnlSincePeriodStart = 0.0;
        }

        row.periodStartingNav = periodStartingNav;
        if (periodStartingNav) {
            row.startFundValueWithCumPnl = *periodStartingNav + cumulativePnlSincePeriodStart;
            row.endFundValueWithCumPnl = *row.startFundValueWithCumPnl + row.totalPnl;
            row.periodCumulativePnl = cumulativePnlSincePeriodStart + row.totalPnl;
        }
        row.dailyReturn = ratio(row.totalPnl, row.startFundValueWithCumPnl);
        row.periodCumulativeReturn = ratio(cumulativePnlSincePeriodStart + row.totalPnl, periodStartingNav);

        cumulativePnlSincePeriodStart += row.totalPnl;
        previousEndFundValue = row.endFundValue;
        previousOvernight = row.overnight;

        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace navledger::application
