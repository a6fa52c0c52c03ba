#pragma once

#include "adapters/secondary/persistence/PostgresRowReader.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace navledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация таблицы overall
 *
 * replaceAll выполняет DELETE и все INSERT в одной транзакции, поэтому
 * читатели никогда не видят частично собранный леджер.
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(R"(
                CREATE TABLE IF NOT EXISTS overall (
                    "Date" TEXT PRIMARY KEY,
                    "Broker P&L" DOUBLE PRECISION,
                    "Total Broker" DOUBLE PRECISION,
                    "Other P&L" DOUBLE PRECISION,
                    "Total Other" DOUBLE PRECISION,
                    "Overnight" DOUBLE PRECISION,
                    "Total P&L" DOUBLE PRECISION,
                    "Period Starting NAV" DOUBLE PRECISION,
                    "Start Fund Value (Accounts Total)" DOUBLE PRECISION,
                    "End Fund Value (Accounts Total)" DOUBLE PRECISION,
                    "Start Fund Value (NAV + Cum. P&L)" DOUBLE PRECISION,
                    "End Fund Value (NAV + Cum. P&L)" DOUBLE PRECISION,
                    "Period Cumulative P&L" DOUBLE PRECISION,
                    "Daily Return" DOUBLE PRECISION,
                    "Period Cumulative Return" DOUBLE PRECISION,
                    "Valuation Date" BOOLEAN
                )
            )");
            t.commit();
            std::cout << "[PostgresLedgerRepo] Connected to " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    void replaceAll(const std::vector<domain::LedgerRow>& rows) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM overall");

            for (const auto& row : rows) {
                t.exec_params(
                    R"(
                        INSERT INTO overall (
                            "Date", "Broker P&L", "Total Broker", "Other P&L", "Total Other",
                            "Overnight", "Total P&L", "Period Starting NAV",
                            "Start Fund Value (Accounts Total)", "End Fund Value (Accounts Total)",
                            "Start Fund Value (NAV + Cum. P&L)", "End Fund Value (NAV + Cum. P&L)",
                            "Period Cumulative P&L", "Daily Return", "Period Cumulative Return",
                            "Valuation Date"
                        )
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)
                    )",
                    row.date,
                    row.brokerPnl,
                    row.totalBroker,
                    row.otherPnl,
                    row.totalOther,
                    row.overnight,
                    row.totalPnl,
                    row.periodStartingNav,
                    row.startFundValue,
                    row.endFundValue,
                    row.startFundValueWithCumPnl,
                    row.endFundValueWithCumPnl,
                    row.periodCumulativePnl,
                    row.dailyReturn,
                    row.periodCumulativeReturn,
                    row.valuationDate
                );
            }

            t.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] replaceAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerRow> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec(R"(
                SELECT "Date", "Broker P&L", "Total Broker", "Other P&L", "Total Other",
                       "Overnight", "Total P&L", "Period Starting NAV",
                       "Start Fund Value (Accounts Total)", "End Fund Value (Accounts Total)",
                       "Start Fund Value (NAV + Cum. P&L)", "End Fund Value (NAV + Cum. P&L)",
                       "Period Cumulative P&L", "Daily Return", "Period Cumulative Return",
                       "Valuation Date"
                FROM overall
            )");
            t.commit();

            std::vector<domain::LedgerRow> rows;
            rows.reserve(result.size());
            for (const auto& r : result) {
                rows.push_back(rowToLedgerRow(r));
            }
            return rows;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void deleteAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM overall");
            t.commit();
            std::cout << "[PostgresLedgerRepo] Table cleared" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerRepo] deleteAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static domain::LedgerRow rowToLedgerRow(const pqxx::row& r) {
        domain::LedgerRow row;
        row.date = r["Date"].as<std::string>();
        row.brokerPnl = optionalDouble(r["Broker P&L"]);
        row.totalBroker = optionalDouble(r["Total Broker"]);
        row.otherPnl = r["Other P&L"].as<double>(0.0);
        row.totalOther = r["Total Other"].as<double>(0.0);
        row.overnight = r["Overnight"].as<double>(0.0);
        row.totalPnl = r["Total P&L"].as<double>(0.0);
        row.periodStartingNav = optionalDouble(r["Period Starting NAV"]);
        row.startFundValue = r["Start Fund Value (Accounts Total)"].as<double>(0.0);
        row.endFundValue = r["End Fund Value (Accounts Total)"].as<double>(0.0);
        row.startFundValueWithCumPnl = optionalDouble(r["Start Fund Value (NAV + Cum. P&L)"]);
        row.endFundValueWithCumPnl = optionalDouble(r["End Fund Value (NAV + Cum. P&L)"]);
        row.periodCumulativePnl = optionalDouble(r["Period Cumulative P&L"]);
        row.dailyReturn = optionalDouble(r["Daily Return"]);
        row.periodCumulativeReturn = optionalDouble(r["Period Cumulative Return"]);
        row.valuationDate = r["Valuation Date"].as<bool>(false);
        return row;
    }

    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace navledger::adapters::secondary
