#pragma once

#include "ports/output/IReportWriter.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace navledger::adapters::secondary {

/**
 * @brief Отчёт в JSON
 *
 * Листы отчёта - ключи верхнего уровня: overall, broker,
 * other_transactions, period_returns, pnl_check. Имена полей строк
 * совпадают с именами колонок таблиц. Пустое значение - null.
 */
class JsonReportWriter : public ports::output::IReportWriter {
public:
    JsonReportWriter() : stdout_(std::cout) {}

    /**
     * @param stdoutStream Поток для назначения "-"; журнал в него не пишется
     */
    explicit JsonReportWriter(std::ostream& stdoutStream) : stdout_(stdoutStream) {}

    static bool isStdout(const std::string& destination) {
        return destination.empty() || destination == "-";
    }

    /**
     * @brief Записать отчёт
     *
     * @param destination Путь к файлу; пустая строка или "-" - stdout
     */
    void write(const domain::LedgerReport& report, const std::string& destination) override {
        auto document = toJson(report);

        if (isStdout(destination)) {
            stdout_ << document.dump(2) << std::endl;
            return;
        }

        std::ofstream file(destination);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open report file: " + destination);
        }
        file << document.dump(2) << std::endl;
        std::cout << "[JsonReportWriter] Report written to " << destination << std::endl;
    }

    static nlohmann::json toJson(const domain::LedgerReport& report) {
        nlohmann::json document;
        document["from"] = report.fromDate;
        document["to"] = report.toDate;

        document["overall"] = nlohmann::json::array();
        for (const auto& row : report.overall) {
            document["overall"].push_back({
                {"Date", row.date},
                {"Broker P&L", nullable(row.brokerPnl)},
                {"Total Broker", nullable(row.totalBroker)},
                {"Other P&L", row.otherPnl},
                {"Total Other", row.totalOther},
                {"Overnight", row.overnight},
                {"Total P&L", row.totalPnl},
                {"Period Starting NAV", nullable(row.periodStartingNav)},
                {"Start Fund Value (Accounts Total)", row.startFundValue},
                {"End Fund Value (Accounts Total)", row.endFundValue},
                {"Start Fund Value (NAV + Cum. P&L)", nullable(row.startFundValueWithCumPnl)},
                {"End Fund Value (NAV + Cum. P&L)", nullable(row.endFundValueWithCumPnl)},
                {"Period Cumulative P&L", nullable(row.periodCumulativePnl)},
                {"Daily Return", nullable(row.dailyReturn)},
                {"Period Cumulative Return", nullable(row.periodCumulativeReturn)},
                {"Valuation Date", row.valuationDate}
            });
        }

        document["broker"] = nlohmann::json::array();
        for (const auto& record : report.broker) {
            document["broker"].push_back({
                {"Date", record.date},
                {"P&L", nullable(record.pnl)},
                {"Reporting Error", record.reportingError},
                {"Cumulative P&L", nullable(record.cumulativePnl)},
                {"Mark-to-Market", nullable(record.markToMarket)},
                {"Change in Dividend Accruals", nullable(record.changeInDividendAccruals)},
                {"Interest", nullable(record.interest)},
                {"Dividends", nullable(record.dividends)},
                {"Deposits & Withdrawals", nullable(record.depositsWithdrawals)},
                {"Change in Interest Accruals", nullable(record.changeInInterestAccruals)},
                {"Commissions", nullable(record.commissions)},
                {"Total Broker", nullable(record.totalBroker)}
            });
        }

        document["other_transactions"] = nlohmann::json::array();
        for (const auto& tx : report.otherTransactions) {
            document["other_transactions"].push_back({
                {"id", tx.id},
                {"Date", tx.date},
                {"Amount", tx.amount},
                {"Account Description", tx.accountDescription},
                {"Transaction Description", tx.transactionDescription},
                {"Counted in P&L", tx.countedInPnl},
                {"Overnight", tx.overnight},
                {"Additional Info", tx.additionalInfo}
            });
        }

        document["period_returns"] = nlohmann::json::array();
        for (const auto& period : report.periodReturns) {
            document["period_returns"].push_back({
                {"Period Start", period.startDate},
                {"Period End", period.endDate},
                {"Days", period.days},
                {"Starting NAV", period.startingNav},
                {"Cumulative P&L", period.cumulativePnl},
                {"Ending Value", period.endingValue},
                {"Cumulative Return", nullable(period.cumulativeReturn)}
            });
        }

        document["pnl_check"] = nlohmann::json::array();
        for (const auto& mismatch : report.pnlCheck) {
            document["pnl_check"].push_back({
                {"Date", mismatch.date},
                {"Stored P&L", nullable(mismatch.storedPnl)},
                {"Formula P&L", mismatch.formulaPnl},
                {"Difference", mismatch.difference}
            });
        }

        return document;
    }

private:
    std::ostream& stdout_;

    static nlohmann::json nullable(const std::optional<double>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
};

} // namespace navledger::adapters::secondary
