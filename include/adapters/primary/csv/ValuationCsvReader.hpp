#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "domain/ValuationOverride.hpp"
#include "utils/CsvParser.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Чтение CSV с датами оценки (колонки Date, Fund Value)
 *
 * Разделитель ',' или ';' определяется по заголовку. Пустой Fund Value -
 * дата оценки без значения. Строки с невалидной датой или значением
 * пропускаются с предупреждением.
 */
class ValuationCsvReader {
public:
    static std::vector<domain::ValuationOverride> read(std::istream& in, const std::string& source) {
        std::string headerLine;
        if (!std::getline(in, headerLine)) {
            throw domain::LedgerValidationError("Empty valuation file: " + source);
        }
        const char delimiter = utils::CsvParser::detectDelimiter(headerLine);

        utils::CsvParser::Record record;
        std::istringstream headerStream(headerLine);
        utils::CsvParser::readRecord(headerStream, record, delimiter);
        auto header = utils::CsvParser::indexHeader(record);
        if (header.find("Date") == header.end() || header.find("Fund Value") == header.end()) {
            throw domain::LedgerValidationError("Missing required columns [Date, Fund Value] in " + source);
        }
        const size_t dateCol = header["Date"];
        const size_t valueCol = header["Fund Value"];

        std::vector<domain::ValuationOverride> valuations;
        int rowNumber = 1;
        while (utils::CsvParser::readRecord(in, record, delimiter)) {
            ++rowNumber;
            record.resize(std::max(record.size(), header.size()));

            auto dateText = utils::CsvParser::trim(record[dateCol]);
            auto valueText = utils::CsvParser::trim(record[valueCol]);
            if (dateText.empty() && valueText.empty()) {
                continue;
            }

            auto date = domain::CalendarDate::parse(dateText);
            if (!date) {
                std::cerr << "[ValuationCsvReader] WARNING skipping row=" << rowNumber
                          << " source=" << source << " invalid date=\"" << dateText
                          << "\" expected MM/DD/YYYY" << std::endl;
                continue;
            }

            std::optional<double> fundValue;
            if (!valueText.empty()) {
                fundValue = utils::CsvParser::parseAmount(valueText);
                if (!fundValue) {
                    std::cerr << "[ValuationCsvReader] WARNING skipping row=" << rowNumber
                              << " source=" << source << " invalid fund value=\"" << valueText << "\"" << std::endl;
                    continue;
                }
            }

            valuations.push_back(domain::ValuationOverride{date->toString(), fundValue});
        }

        std::cout << "[ValuationCsvReader] " << source << ": "
                  << valuations.size() << " valuation dates" << std::endl;
        return valuations;
    }

    static std::vector<domain::ValuationOverride> readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw domain::LedgerValidationError("Cannot open file: " + path);
        }
        return read(file, path);
    }
};

} // namespace navledger::adapters::primary
