#pragma once

#include "domain/BrokerDayRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace navledger::ports::output {

/**
 * @brief Интерфейс репозитория брокерских снимков (таблица broker)
 *
 * Output Port. Порядок findAll() не гарантирован: сортировка по
 * календарной дате - забота вызывающего.
 */
class IBrokerRecordRepository {
public:
    virtual ~IBrokerRecordRepository() = default;

    /**
     * @brief Вставить или заменить запись за дату
     */
    virtual void upsert(const domain::BrokerDayRecord& record) = 0;

    /**
     * @brief Найти запись за дату
     *
     * @param date Дата MM/DD/YYYY
     * @return Запись или nullopt
     */
    virtual std::optional<domain::BrokerDayRecord> findByDate(const std::string& date) = 0;

    /**
     * @brief Все записи
     */
    virtual std::vector<domain::BrokerDayRecord> findAll() = 0;

    /**
     * @brief Удалить все записи
     */
    virtual void deleteAll() = 0;
};

} // namespace navledger::ports::output
