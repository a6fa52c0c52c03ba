#pragma once

#include "domain/LedgerRow.hpp"
#include <cstddef>
#include <vector>

namespace navledger::ports::input {

/**
 * @brief Интерфейс сервиса леджера
 *
 * Input Port. Леджер только пересобирается целиком: частичных
 * обновлений не бывает.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Пересобрать таблицу overall из текущих данных
     *
     * Идемпотентна: два вызова на одних данных дают одинаковую таблицу.
     *
     * @return Число строк леджера (0, если брокерских данных ещё нет)
     */
    virtual std::size_t rebuildLedger() = 0;

    /**
     * @brief Текущий леджер в хронологическом порядке
     */
    virtual std::vector<domain::LedgerRow> getLedger() = 0;
};

} // namespace navledger::ports::input
