#pragma once

namespace navledger::domain {

/**
 * @brief Что произошло при сохранении записи с ключом уникальности
 */
enum class SaveOutcome {
    INSERTED,   ///< Новая строка
    UPDATED     ///< Строка с тем же ключом уже была, обновлены неключевые поля
};

} // namespace navledger::domain
