#pragma once

#include "domain/ValuationOverride.hpp"
#include <optional>
#include <string>
#include <vector>

namespace navledger::ports::output {

/**
 * @brief Интерфейс репозитория пользовательских дат оценки (таблица valuation_dates)
 *
 * Output Port.
 */
class IValuationDateRepository {
public:
    virtual ~IValuationDateRepository() = default;

    /**
     * @brief Вставить или заменить дату оценки
     */
    virtual void upsert(const domain::ValuationOverride& valuation) = 0;

    /**
     * @brief Найти дату оценки
     */
    virtual std::optional<domain::ValuationOverride> findByDate(const std::string& date) = 0;

    /**
     * @brief Все даты оценки
     */
    virtual std::vector<domain::ValuationOverride> findAll() = 0;

    /**
     * @brief Удалить дату оценки
     *
     * @return true если дата была и удалена
     */
    virtual bool deleteByDate(const std::string& date) = 0;

    /**
     * @brief Удалить все даты оценки
     */
    virtual void deleteAll() = 0;
};

} // namespace navledger::ports::output
