#pragma once

#include "domain/BrokerDayRecord.hpp"
#include "domain/BrokerStatement.hpp"
#include "domain/OtherTransaction.hpp"
#include "domain/ValuationOverride.hpp"
#include "domain/enums/LedgerTable.hpp"
#include "domain/enums/SaveOutcome.hpp"
#include <optional>
#include <string>
#include <vector>

namespace navledger::ports::input {

/**
 * @brief Итог пакетной загрузки
 */
struct ImportSummary {
    int processed = 0;
    int inserted = 0;
    int updated = 0;
};

/**
 * @brief Интерфейс загрузки и сопровождения исходных данных
 *
 * Input Port. Каждая изменяющая операция завершается пересборкой леджера.
 *
 * @throws domain::LedgerValidationError при невалидной дате
 */
class IRecordService {
public:
    virtual ~IRecordService() = default;

    /**
     * @brief Загрузить брокерскую выписку за день
     *
     * Сверяет P&L двумя методами, сохраняет запись, пересчитывает
     * Cumulative P&L.
     *
     * @return Сохранённая запись
     */
    virtual domain::BrokerDayRecord ingestBrokerStatement(const domain::BrokerStatement& statement) = 0;

    /**
     * @brief Загрузить пакет выписок (одна пересборка в конце)
     */
    virtual ImportSummary ingestBrokerStatements(const std::vector<domain::BrokerStatement>& statements) = 0;

    /**
     * @brief Добавить прочую транзакцию
     *
     * @return INSERTED или UPDATED (такой ключ уже был)
     */
    virtual domain::SaveOutcome addOtherTransaction(const domain::OtherTransaction& transaction) = 0;

    /**
     * @brief Добавить пакет прочих транзакций
     */
    virtual ImportSummary addOtherTransactions(const std::vector<domain::OtherTransaction>& transactions) = 0;

    /**
     * @brief Добавить дату оценки
     *
     * Существующая дата: значение обновляется, только если оно передано.
     *
     * @return INSERTED или UPDATED
     */
    virtual domain::SaveOutcome addValuationDate(const std::string& date, std::optional<double> fundValue) = 0;

    /**
     * @brief Добавить пакет дат оценки
     */
    virtual ImportSummary addValuationDates(const std::vector<domain::ValuationOverride>& valuations) = 0;

    /**
     * @brief Удалить дату оценки
     *
     * @return false если такой даты нет
     */
    virtual bool deleteValuationDate(const std::string& date) = 0;

    /**
     * @brief Даты оценки в хронологическом порядке
     */
    virtual std::vector<domain::ValuationOverride> listValuationDates() = 0;

    /**
     * @brief Очистить таблицу
     */
    virtual void clearTable(domain::LedgerTable table) = 0;
};

} // namespace navledger::ports::input
