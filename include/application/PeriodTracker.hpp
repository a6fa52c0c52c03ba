#pragma once

#include "domain/CalendarDate.hpp"
#include <algorithm>
#include <set>
#include <utility>
#include <vector>

namespace navledger::application {

/**
 * @brief Вычисление дат оценки
 *
 * Дата оценки - первая встреченная дата каждого календарного месяца
 * плюс любая дата из valuation_dates. Чистые функции без состояния.
 */
class PeriodTracker {
public:
    /**
     * @brief Первая дата каждой пары (год, месяц)
     *
     * @param dates Известные даты в любом порядке
     */
    static std::set<domain::CalendarDate> firstDatesOfMonth(std::vector<domain::CalendarDate> dates) {
        std::sort(dates.begin(), dates.end());

        std::set<domain::CalendarDate> result;
        std::set<std::pair<int, int>> monthsSeen;
        for (const auto& date : dates) {
            if (monthsSeen.insert({date.year, date.month}).second) {
                result.insert(date);
            }
        }
        return result;
    }

    /**
     * @brief Множество дат оценки
     *
     * @param dates Все известные даты
     * @param overrideDates Даты из valuation_dates (со значением или без)
     */
    static std::set<domain::CalendarDate> valuationDates(
        const std::vector<domain::CalendarDate>& dates,
        const std::set<domain::CalendarDate>& overrideDates
    ) {
        auto result = firstDatesOfMonth(dates);
        result.insert(overrideDates.begin(), overrideDates.end());
        return result;
    }
};

} // namespace navledger::application
