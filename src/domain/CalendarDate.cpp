#include "domain/CalendarDate.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace navledger::domain {

namespace {

const std::array<const char*, 12> MONTH_NAMES = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Разбирает неотрицательное число из [minDigits, maxDigits] цифр целиком
bool parseNumber(const std::string& s, size_t minDigits, size_t maxDigits, int& out) {
    if (s.size() < minDigits || s.size() > maxDigits) {
        return false;
    }
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

std::optional<CalendarDate> parseSeparated(const std::string& text, char sep,
                                           int yearPos, int monthPos, int dayPos) {
    std::array<std::string, 3> parts;
    size_t start = 0;
    for (int i = 0; i < 3; ++i) {
        size_t pos = text.find(sep, start);
        if (i < 2) {
            if (pos == std::string::npos) {
                return std::nullopt;
            }
            parts[i] = text.substr(start, pos - start);
            start = pos + 1;
        } else {
            if (pos != std::string::npos) {
                return std::nullopt;
            }
            parts[i] = text.substr(start);
        }
    }

    int year = 0, month = 0, day = 0;
    if (!parseNumber(parts[yearPos], 4, 4, year) ||
        !parseNumber(parts[monthPos], 1, 2, month) ||
        !parseNumber(parts[dayPos], 1, 2, day)) {
        return std::nullopt;
    }
    if (!CalendarDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

// "January 15, 2023"
std::optional<CalendarDate> parseLongForm(const std::string& text) {
    std::istringstream ss(text);
    std::string monthName, dayPart, yearPart;
    if (!(ss >> monthName >> dayPart >> yearPart)) {
        return std::nullopt;
    }
    std::string rest;
    if (ss >> rest) {
        return std::nullopt;
    }
    if (dayPart.empty() || dayPart.back() != ',') {
        return std::nullopt;
    }
    dayPart.pop_back();

    std::transform(monthName.begin(), monthName.end(), monthName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = std::find(MONTH_NAMES.begin(), MONTH_NAMES.end(), monthName);
    if (it == MONTH_NAMES.end()) {
        return std::nullopt;
    }
    int month = static_cast<int>(it - MONTH_NAMES.begin()) + 1;

    int year = 0, day = 0;
    if (!parseNumber(dayPart, 1, 2, day) || !parseNumber(yearPart, 4, 4, year)) {
        return std::nullopt;
    }
    if (!CalendarDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

} // namespace

std::optional<CalendarDate> CalendarDate::parse(const std::string& text) {
    return parseSeparated(trim(text), '/', 2, 0, 1);
}

std::optional<CalendarDate> CalendarDate::parseFlexible(const std::string& text) {
    std::string value = trim(text);
    if (auto date = parseSeparated(value, '/', 2, 0, 1)) {
        return date;
    }
    if (auto date = parseSeparated(value, '-', 0, 1, 2)) {
        return date;
    }
    return parseLongForm(value);
}

int CalendarDate::daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}

bool CalendarDate::isValid(int year, int month, int day) {
    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

std::string CalendarDate::toString() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << month << '/'
       << std::setw(2) << day << '/'
       << std::setw(4) << year;
    return ss.str();
}

} // namespace navledger::domain
