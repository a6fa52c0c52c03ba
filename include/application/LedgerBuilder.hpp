#pragma once

#include "domain/BrokerDayRecord.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerRow.hpp"
#include "domain/OtherTransaction.hpp"
#include "domain/ValuationOverride.hpp"
#include <optional>
#include <vector>

namespace navledger::application {

/**
 * @brief Исходные данные для сборки леджера
 */
struct LedgerInputs {
    std::vector<domain::BrokerDayRecord> brokerRecords;
    std::vector<domain::OtherTransaction> otherTransactions;
    std::vector<domain::ValuationOverride> valuationOverrides;
};

/**
 * @brief Сборка леджера за один проход по датам
 *
 * Даты леджера - объединение дат broker и other_transactions, по
 * возрастанию календарной даты. Для каждой даты:
 * - Total Other = нарастающий итог всех прочих транзакций (сбрасывается
 *   в 0 на дате runningTotalEpoch);
 * - End Fund Value = Total Broker + Total Other - Overnight дня;
 * - Start Fund Value = значение из valuation_dates, иначе перенос
 *   End Fund Value + Overnight предыдущего дня, иначе End Fund Value;
 * - на дате оценки Period Starting NAV = Start Fund Value, накопленный
 *   P&L периода обнуляется.
 *
 * Без брокерских записей леджер пуст. Строки с невалидной датой
 * пропускаются с предупреждением.
 */
class LedgerBuilder {
public:
    explicit LedgerBuilder(std::optional<domain::CalendarDate> runningTotalEpoch)
        : runningTotalEpoch_(runningTotalEpoch) {}

    /**
     * @brief Собрать леджер
     *
     * @return Строки в хронологическом порядке
     */
    std::vector<domain::LedgerRow> build(const LedgerInputs& inputs) const;

private:
    std::optional<domain::CalendarDate> runningTotalEpoch_;
};

} // namespace navledger::application
