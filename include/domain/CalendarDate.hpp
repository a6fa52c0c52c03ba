#pragma once

#include <optional>
#include <string>

namespace navledger::domain {

/**
 * @brief Календарная дата без времени
 *
 * Все таблицы хранят даты строкой формата MM/DD/YYYY, но сравнивать
 * такие строки лексически нельзя ("01/05/2024" < "12/01/2023").
 * Поэтому упорядочивание всегда идёт через CalendarDate.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Разобрать строку MM/DD/YYYY
     *
     * Месяц и день могут быть из одной или двух цифр, год из четырёх.
     * День должен существовать в этом месяце.
     *
     * @return Дата или nullopt, если строка невалидна
     */
    static std::optional<CalendarDate> parse(const std::string& text);

    /**
     * @brief Разобрать дату в одном из форматов входных файлов
     *
     * MM/DD/YYYY, YYYY-MM-DD или "January 15, 2023".
     */
    static std::optional<CalendarDate> parseFlexible(const std::string& text);

    /**
     * @brief Проверить корректность тройки год/месяц/день
     */
    static bool isValid(int year, int month, int day);

    static int daysInMonth(int year, int month);

    /**
     * @brief Каноническое представление MM/DD/YYYY (с ведущими нулями)
     */
    std::string toString() const;

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }
};

/**
 * @brief Нормализовать строку даты к MM/DD/YYYY
 *
 * @return Каноническая строка или nullopt для невалидной даты
 */
inline std::optional<std::string> normalizeDate(const std::string& text) {
    auto date = CalendarDate::parse(text);
    if (!date) {
        return std::nullopt;
    }
    return date->toString();
}

} // namespace navledger::domain
