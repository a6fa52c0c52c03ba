#pragma once

#include "adapters/primary/csv/CsvFolder.hpp"
#include "domain/BrokerStatement.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "utils/CsvParser.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Чтение дневной брокерской выписки
 *
 * Формат: колонки Statement, Field Name, Field Value. Дата берётся из
 * строки Field Name = "Period" ("January 15, 2023"). Значения берутся из
 * строк секции "Change in NAV", первая строка секции - её заголовок.
 */
class BrokerStatementCsvReader {
public:
    static constexpr const char* NAV_SECTION = "Change in NAV";

    static domain::BrokerStatement read(std::istream& in, const std::string& source) {
        utils::CsvParser::Record record;
        if (!utils::CsvParser::readRecord(in, record)) {
            throw domain::LedgerValidationError("Empty broker statement: " + source);
        }

        auto header = utils::CsvParser::indexHeader(record);
        for (const char* column : {"Statement", "Field Name", "Field Value"}) {
            if (header.find(column) == header.end()) {
                throw domain::LedgerValidationError(
                    std::string("Missing column '") + column + "' in " + source);
            }
        }
        const size_t statementCol = header["Statement"];
        const size_t nameCol = header["Field Name"];
        const size_t valueCol = header["Field Value"];

        domain::BrokerStatement statement;
        bool periodFound = false;
        bool sectionHeaderSkipped = false;

        while (utils::CsvParser::readRecord(in, record)) {
            if (record.size() <= std::max({statementCol, nameCol, valueCol})) {
                continue;
            }
            auto name = utils::CsvParser::trim(record[nameCol]);
            const auto& value = record[valueCol];

            if (name == "Period" && !periodFound) {
                auto date = domain::CalendarDate::parseFlexible(value);
                if (!date) {
                    throw domain::LedgerValidationError(
                        "Unparseable Period '" + value + "' in " + source);
                }
                statement.date = date->toString();
                periodFound = true;
                continue;
            }

            if (utils::CsvParser::trim(record[statementCol]) != NAV_SECTION) {
                continue;
            }
            if (!sectionHeaderSkipped) {
                sectionHeaderSkipped = true;
                continue;
            }
            assignField(statement, name, utils::CsvParser::parseAmount(value));
        }

        if (!periodFound) {
            throw domain::LedgerValidationError("No 'Period' field found in " + source);
        }
        return statement;
    }

    static domain::BrokerStatement readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw domain::LedgerValidationError("Cannot open file: " + path);
        }
        std::cout << "[BrokerStatementCsvReader] Reading " << path << std::endl;
        return read(file, path);
    }

    /**
     * @brief Прочитать все выписки каталога
     *
     * Файл с ошибкой пропускается с сообщением, остальные читаются.
     */
    static std::vector<domain::BrokerStatement> readFolder(const std::string& directory) {
        std::vector<domain::BrokerStatement> statements;
        for (const auto& path : listCsvFiles(directory)) {
            try {
                statements.push_back(readFile(path));
            } catch (const domain::LedgerValidationError& e) {
                std::cerr << "[BrokerStatementCsvReader] Skipping file: " << e.what() << std::endl;
            }
        }
        return statements;
    }

private:
    static void assignField(domain::BrokerStatement& s, const std::string& name, std::optional<double> value) {
        if (name == "Starting Value")                   s.startingValue = value;
        else if (name == "Ending Value")                s.endingValue = value;
        else if (name == "Mark-to-Market")              s.markToMarket = value;
        else if (name == "Interest")                    s.interest = value;
        else if (name == "Dividends")                   s.dividends = value;
        else if (name == "Change in Interest Accruals") s.changeInInterestAccruals = value;
        else if (name == "Change in Dividend Accruals") s.changeInDividendAccruals = value;
        else if (name == "Commissions")                 s.commissions = value;
        else if (name == "Deposits & Withdrawals")      s.depositsWithdrawals = value;
    }
};

} // namespace navledger::adapters::primary
