#pragma once

#include "adapters/secondary/persistence/PostgresRowReader.hpp"
#include "ports/output/IBrokerRecordRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace navledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация таблицы broker
 *
 * Соединение открывается на каждую операцию. Таблица создаётся при
 * первом подключении, если её нет.
 */
class PostgresBrokerRecordRepository : public ports::output::IBrokerRecordRepository {
public:
    explicit PostgresBrokerRecordRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(R"(
                CREATE TABLE IF NOT EXISTS broker (
                    "Date" TEXT PRIMARY KEY,
                    "P&L" DOUBLE PRECISION,
                    "Reporting Error" DOUBLE PRECISION,
                    "Cumulative P&L" DOUBLE PRECISION,
                    "Mark-to-Market" DOUBLE PRECISION,
                    "Change in Dividend Accruals" DOUBLE PRECISION,
                    "Interest" DOUBLE PRECISION,
                    "Dividends" DOUBLE PRECISION,
                    "Deposits & Withdrawals" DOUBLE PRECISION,
                    "Change in Interest Accruals" DOUBLE PRECISION,
                    "Commissions" DOUBLE PRECISION,
                    "Total Broker" DOUBLE PRECISION
                )
            )");
            t.commit();
            std::cout << "[PostgresBrokerRepo] Connected to " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBrokerRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    void upsert(const domain::BrokerDayRecord& record) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                R"(
                    INSERT INTO broker (
                        "Date", "P&L", "Reporting Error", "Cumulative P&L", "Mark-to-Market",
                        "Change in Dividend Accruals", "Interest", "Dividends",
                        "Deposits & Withdrawals", "Change in Interest Accruals",
                        "Commissions", "Total Broker"
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)
                    ON CONFLICT ("Date") DO UPDATE SET
                        "P&L" = EXCLUDED."P&L",
                        "Reporting Error" = EXCLUDED."Reporting Error",
                        "Cumulative P&L" = EXCLUDED."Cumulative P&L",
                        "Mark-to-Market" = EXCLUDED."Mark-to-Market",
                        "Change in Dividend Accruals" = EXCLUDED."Change in Dividend Accruals",
                        "Interest" = EXCLUDED."Interest",
                        "Dividends" = EXCLUDED."Dividends",
                        "Deposits & Withdrawals" = EXCLUDED."Deposits & Withdrawals",
                        "Change in Interest Accruals" = EXCLUDED."Change in Interest Accruals",
                        "Commissions" = EXCLUDED."Commissions",
                        "Total Broker" = EXCLUDED."Total Broker"
                )",
                record.date,
                record.pnl,
                record.reportingError,
                record.cumulativePnl,
                record.markToMarket,
                record.changeInDividendAccruals,
                record.interest,
                record.dividends,
                record.depositsWithdrawals,
                record.changeInInterestAccruals,
                record.commissions,
                record.totalBroker
            );
            t.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBrokerRepo] upsert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::BrokerDayRecord> findByDate(const std::string& date) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec_params(SELECT_COLUMNS + std::string(R"( WHERE "Date" = $1)"), date);
            t.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToRecord(result[0]);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBrokerRepo] findByDate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::BrokerDayRecord> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec(SELECT_COLUMNS);
            t.commit();

            std::vector<domain::BrokerDayRecord> records;
            records.reserve(result.size());
            for (const auto& row : result) {
                records.push_back(rowToRecord(row));
            }
            return records;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBrokerRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void deleteAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM broker");
            t.commit();
            std::cout << "[PostgresBrokerRepo] Table cleared" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBrokerRepo] deleteAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT "Date", "P&L", "Reporting Error", "Cumulative P&L", "Mark-to-Market",
               "Change in Dividend Accruals", "Interest", "Dividends",
               "Deposits & Withdrawals", "Change in Interest Accruals",
               "Commissions", "Total Broker"
        FROM broker
    )";

    static domain::BrokerDayRecord rowToRecord(const pqxx::row& row) {
        domain::BrokerDayRecord record;
        record.date = row["Date"].as<std::string>();
        record.pnl = optionalDouble(row["P&L"]);
        record.reportingError = optionalDouble(row["Reporting Error"]).value_or(0.0);
        record.cumulativePnl = optionalDouble(row["Cumulative P&L"]);
        record.markToMarket = optionalDouble(row["Mark-to-Market"]);
        record.changeInDividendAccruals = optionalDouble(row["Change in Dividend Accruals"]);
        record.interest = optionalDouble(row["Interest"]);
        record.dividends = optionalDouble(row["Dividends"]);
        record.depositsWithdrawals = optionalDouble(row["Deposits & Withdrawals"]);
        record.changeInInterestAccruals = optionalDouble(row["Change in Interest Accruals"]);
        record.commissions = optionalDouble(row["Commissions"]);
        record.totalBroker = optionalDouble(row["Total Broker"]);
        return record;
    }

    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace navledger::adapters::secondary
