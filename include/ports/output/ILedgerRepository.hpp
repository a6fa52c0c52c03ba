#pragma once

#include "domain/LedgerRow.hpp"
#include <vector>

namespace navledger::ports::output {

/**
 * @brief Интерфейс хранилища леджера (таблица overall)
 *
 * Output Port. Таблица никогда не обновляется частично: только полная
 * замена, атомарно для следующего чтения.
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Заменить содержимое таблицы целиком (delete-all, insert-all)
     */
    virtual void replaceAll(const std::vector<domain::LedgerRow>& rows) = 0;

    /**
     * @brief Все строки леджера
     */
    virtual std::vector<domain::LedgerRow> findAll() = 0;

    /**
     * @brief Очистить таблицу
     */
    virtual void deleteAll() = 0;
};

} // namespace navledger::ports::output
