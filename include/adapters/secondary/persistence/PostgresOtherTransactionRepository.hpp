#pragma once

#include "ports/output/IOtherTransactionRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace navledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация таблицы other_transactions
 *
 * Повтор по ключу (Date, Account Description, Transaction Description, Amount)
 * обновляет флаги и Additional Info. Вставку от обновления отличает
 * xmax = 0 в RETURNING.
 */
class PostgresOtherTransactionRepository : public ports::output::IOtherTransactionRepository {
public:
    explicit PostgresOtherTransactionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec(R"(
                CREATE TABLE IF NOT EXISTS other_transactions (
                    "id" INTEGER GENERATED BY DEFAULT AS IDENTITY PRIMARY KEY,
                    "Date" TEXT,
                    "Amount" DOUBLE PRECISION,
                    "Account Description" TEXT,
                    "Transaction Description" TEXT,
                    "Counted in P&L" BOOLEAN,
                    "Overnight" BOOLEAN,
                    "Additional Info" TEXT,
                    UNIQUE ("Date", "Account Description", "Transaction Description", "Amount")
                )
            )");
            t.commit();
            std::cout << "[PostgresOtherTxRepo] Connected to " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOtherTxRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::SaveOutcome save(const domain::OtherTransaction& transaction) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec_params(
                R"(
                    INSERT INTO other_transactions (
                        "Date", "Amount", "Account Description", "Transaction Description",
                        "Counted in P&L", "Overnight", "Additional Info"
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7)
                    ON CONFLICT ("Date", "Account Description", "Transaction Description", "Amount")
                    DO UPDATE SET
                        "Counted in P&L" = EXCLUDED."Counted in P&L",
                        "Overnight" = EXCLUDED."Overnight",
                        "Additional Info" = EXCLUDED."Additional Info"
                    RETURNING (xmax = 0) AS inserted
                )",
                transaction.date,
                transaction.amount,
                transaction.accountDescription,
                transaction.transactionDescription,
                transaction.countedInPnl,
                transaction.overnight,
                transaction.additionalInfo
            );
            t.commit();

            bool inserted = result[0]["inserted"].as<bool>();
            std::cout << "[PostgresOtherTxRepo] " << (inserted ? "Inserted" : "Updated")
                      << " transaction " << transaction.date << " "
                      << transaction.accountDescription << " " << transaction.amount << std::endl;
            return inserted ? domain::SaveOutcome::INSERTED : domain::SaveOutcome::UPDATED;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOtherTxRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::OtherTransaction> findByDate(const std::string& date) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec_params(
                SELECT_COLUMNS + std::string(R"( WHERE "Date" = $1 ORDER BY "id")"), date);
            t.commit();
            return rowsToTransactions(result);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOtherTxRepo] findByDate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::OtherTransaction> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto result = t.exec(SELECT_COLUMNS + std::string(R"( ORDER BY "id")"));
            t.commit();
            return rowsToTransactions(result);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOtherTxRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void deleteAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM other_transactions");
            t.commit();
            std::cout << "[PostgresOtherTxRepo] Table cleared" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOtherTxRepo] deleteAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT "id", "Date", "Amount", "Account Description", "Transaction Description",
               "Counted in P&L", "Overnight", "Additional Info"
        FROM other_transactions
    )";

    static std::vector<domain::OtherTransaction> rowsToTransactions(const pqxx::result& result) {
        std::vector<domain::OtherTransaction> transactions;
        transactions.reserve(result.size());
        for (const auto& row : result) {
            domain::OtherTransaction tx;
            tx.id = row["id"].as<int64_t>();
            tx.date = row["Date"].as<std::string>();
            tx.amount = row["Amount"].as<double>(0.0);
            tx.accountDescription = row["Account Description"].as<std::string>(std::string());
            tx.transactionDescription = row["Transaction Description"].as<std::string>(std::string());
            tx.countedInPnl = row["Counted in P&L"].as<bool>(false);
            tx.overnight = row["Overnight"].as<bool>(false);
            tx.additionalInfo = row["Additional Info"].as<std::string>(std::string());
            transactions.push_back(tx);
        }
        return transactions;
    }

    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace navledger::adapters::secondary
