#pragma once

#include <algorithm>
#include <cctype>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace navledger::utils {

/**
 * @brief Минимальный разбор CSV (RFC 4180)
 *
 * Поддерживает поля в кавычках со встроенным разделителем, переводом
 * строки и удвоенными кавычками. Заголовок - первая запись.
 */
class CsvParser {
public:
    using Record = std::vector<std::string>;

    /**
     * @brief Прочитать следующую запись
     *
     * @return false, если поток закончился
     */
    static bool readRecord(std::istream& in, Record& record, char delimiter = ',') {
        record.clear();

        std::string field;
        bool inQuotes = false;
        bool any = false;
        char c;

        while (in.get(c)) {
            any = true;
            if (inQuotes) {
                if (c == '"') {
                    if (in.peek() == '"') {
                        field += '"';
                        in.get(c);
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == '"') {
                inQuotes = true;
            } else if (c == delimiter) {
                record.push_back(field);
                field.clear();
            } else if (c == '\n') {
                break;
            } else if (c != '\r') {
                field += c;
            }
        }

        if (!any) {
            return false;
        }
        record.push_back(field);
        return true;
    }

    /**
     * @brief Разделитель по строке заголовка: ';', если запятых нет
     */
    static char detectDelimiter(const std::string& headerLine) {
        auto commas = std::count(headerLine.begin(), headerLine.end(), ',');
        auto semicolons = std::count(headerLine.begin(), headerLine.end(), ';');
        return semicolons > commas ? ';' : ',';
    }

    /**
     * @brief Индексы колонок по именам заголовка
     */
    static std::unordered_map<std::string, size_t> indexHeader(const Record& header) {
        std::unordered_map<std::string, size_t> index;
        for (size_t i = 0; i < header.size(); ++i) {
            auto name = trim(header[i]);
            // BOM в начале файла
            if (i == 0 && name.rfind("\xEF\xBB\xBF", 0) == 0) {
                name = name.substr(3);
            }
            index.emplace(name, i);
        }
        return index;
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(),
            [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(),
            [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    /**
     * @brief Денежное значение: "$1,234.56", "-500", " 12 "
     *
     * @return nullopt для пустого или нечислового значения
     */
    static std::optional<double> parseAmount(const std::string& text) {
        std::string clean;
        for (char c : text) {
            if (c != '$' && c != ',') {
                clean += c;
            }
        }
        clean = trim(clean);

        std::string lower = clean;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (clean.empty() || lower == "nan" || lower == "none") {
            return std::nullopt;
        }

        try {
            size_t consumed = 0;
            double value = std::stod(clean, &consumed);
            if (consumed != clean.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    /**
     * @brief true/1/yes/y в любом регистре
     */
    static bool parseBool(const std::string& text) {
        std::string value = trim(text);
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value == "true" || value == "1" || value == "yes" || value == "y";
    }
};

} // namespace navledger::utils
