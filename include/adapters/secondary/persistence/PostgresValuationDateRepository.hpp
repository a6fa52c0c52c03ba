#pragma once

#include "adapters/secondary/persistence/PostgresRowReader.hpp"
#include "ports/output/IValuationDateRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace navledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация таблицы valuation_dates
 */
class PostgresValuationDateRepository : public ports::output::IValuationDateRepository {
public:
    explicit PostgresValuationDateRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(R"(
                CREATE TABLE IF NOT EXISTS valuation_dates (
                    "Date" TEXT PRIMARY KEY,
                    "Fund Value" DOUBLE PRECISION
                )
            )");
            t.commit();
            std::cout << "[PostgresValuationRepo] Connected to " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    void upsert(const domain::ValuationOverride& valuation) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                R"(
                    INSERT INTO valuation_dates ("Date", "Fund Value") VALUES ($1, $2)
                    ON CONFLICT ("Date") DO UPDATE SET "Fund Value" = EXCLUDED."Fund Value"
                )",
                valuation.date,
                valuation.fundValue
            );
            t.commit();
            std::cout << "[PostgresValuationRepo] Saved valuation date " << valuation.date << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] upsert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::ValuationOverride> findByDate(const std::string& date) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec_params(
                R"(SELECT "Date", "Fund Value" FROM valuation_dates WHERE "Date" = $1)", date);
            t.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return domain::ValuationOverride{
                result[0]["Date"].as<std::string>(),
                optionalDouble(result[0]["Fund Value"])};
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] findByDate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::ValuationOverride> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec(R"(SELECT "Date", "Fund Value" FROM valuation_dates)");
            t.commit();

            std::vector<domain::ValuationOverride> valuations;
            valuations.reserve(result.size());
            for (const auto& row : result) {
                valuations.push_back(domain::ValuationOverride{
                    row["Date"].as<std::string>(),
                    optionalDouble(row["Fund Value"])});
            }
            return valuations;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteByDate(const std::string& date) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec_params(R"(DELETE FROM valuation_dates WHERE "Date" = $1)", date);
            t.commit();
            return result.affected_rows() > 0;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] deleteByDate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void deleteAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM valuation_dates");
            t.commit();
            std::cout << "[PostgresValuationRepo] Table cleared" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresValuationRepo] deleteAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace navledger::adapters::secondary
