#pragma once

#include "adapters/primary/csv/CsvFolder.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "domain/OtherTransaction.hpp"
#include "utils/CsvParser.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Чтение CSV с прочими транзакциями
 */
class OtherTransactionsCsvReader {
public:
    static std::vector<domain::OtherTransaction> read(std::istream& in, const std::string& source) {
        utils::CsvParser::Record record;
        if (!utils::CsvParser::readRecord(in, record)) {
            throw domain::LedgerValidationError("Empty transactions file: " + source);
        }

        auto header = utils::CsvParser::indexHeader(record);
        std::string missing;
        for (const char* column : REQUIRED_COLUMNS) {
            if (header.find(column) == header.end()) {
                missing += missing.empty() ? column : std::string(", ") + column;
            }
        }
        if (!missing.empty()) {
            throw domain::LedgerValidationError("Missing required columns [" + missing + "] in " + source);
        }

        std::vector<domain::OtherTransaction> transactions;
        int rowNumber = 1;
        while (utils::CsvParser::readRecord(in, record)) {
            ++rowNumber;
            if (record.size() == 1 && utils::CsvParser::trim(record[0]).empty()) {
                continue;
            }
            record.resize(std::max(record.size(), header.size()));
            auto field = [&](const char* column) { return record[header[column]]; };

            auto date = domain::CalendarDate::parseFlexible(field("Date"));
            if (!date) {
                std::cerr << "[OtherTransactionsCsvReader] WARNING skipping row=" << rowNumber
                          << " source=" << source << " invalid date=\"" << field("Date") << "\"" << std::endl;
                continue;
            }
            auto amount = utils::CsvParser::parseAmount(field("Amount"));
            if (!amount) {
                std::cerr << "[OtherTransactionsCsvReader] WARNING skipping row=" << rowNumber
                          << " source=" << source << " invalid amount=\"" << field("Amount") << "\"" << std::endl;
                continue;
            }

            transactions.emplace_back(
                date->toString(),
                *amount,
                utils::CsvParser::trim(field("Account Description")),
                utils::CsvParser::trim(field("Transaction Description")),
                utils::CsvParser::parseBool(field("Counted in P&L")),
                utils::CsvParser::parseBool(field("Overnight")),
                utils::CsvParser::trim(field("Additional Info"))
            );
        }

        std::cout << "[OtherTransactionsCsvReader] " << source << ": "
                  << transactions.size() << " transactions" << std::endl;
        return transactions;
    }

    static std::vector<domain::OtherTransaction> readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw domain::LedgerValidationError("Cannot open file: " + path);
        }
        return read(file, path);
    }

    static std::vector<domain::OtherTransaction> readFolder(const std::string& directory) {
        std::vector<domain::OtherTransaction> transactions;
        for (const auto& path : listCsvFiles(directory)) {
            try {
                auto fileTransactions = readFile(path);
                transactions.insert(transactions.end(), fileTransactions.begin(), fileTransactions.end());
            } catch (const domain::LedgerValidationError& e) {
                std::cerr << "[OtherTransactionsCsvReader] Skipping file: " << e.what() << std::endl;
            }
        }
        return transactions;
    }

private:
    static constexpr const char* REQUIRED_COLUMNS[] = {
        "Date", "Amount", "Account Description", "Transaction Description",
        "Counted in P&L", "Overnight", "Additional Info"
    };
};

} // namespace navledger::adapters::primary
