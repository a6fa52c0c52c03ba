#pragma once

#include "domain/OtherTransaction.hpp"
#include "domain/enums/SaveOutcome.hpp"
#include <string>
#include <vector>

namespace navledger::ports::output {

/**
 * @brief Интерфейс репозитория прочих транзакций (таблица other_transactions)
 *
 * Output Port.
 */
class IOtherTransactionRepository {
public:
    virtual ~IOtherTransactionRepository() = default;

    /**
     * @brief Сохранить транзакцию
     *
     * Ключ уникальности: (date, accountDescription, transactionDescription, amount).
     * Для существующего ключа обновляются флаги и примечание, дубль не создаётся.
     *
     * @return INSERTED или UPDATED
     */
    virtual domain::SaveOutcome save(const domain::OtherTransaction& transaction) = 0;

    /**
     * @brief Транзакции за дату
     */
    virtual std::vector<domain::OtherTransaction> findByDate(const std::string& date) = 0;

    /**
     * @brief Все транзакции
     */
    virtual std::vector<domain::OtherTransaction> findAll() = 0;

    /**
     * @brief Удалить все транзакции
     */
    virtual void deleteAll() = 0;
};

} // namespace navledger::ports::output
