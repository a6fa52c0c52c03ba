#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <mutex>

namespace navledger::adapters::secondary {

/**
 * @brief In-memory реализация таблицы overall
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    void replaceAll(const std::vector<domain::LedgerRow>& rows) override {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_ = rows;
        ++replaceCount_;
    }

    std::vector<domain::LedgerRow> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_;
    }

    void deleteAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_.clear();
    }

    /**
     * @brief Сколько раз таблица заменялась целиком
     */
    int getReplaceCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return replaceCount_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::LedgerRow> rows_;
    int replaceCount_ = 0;
};

} // namespace navledger::adapters::secondary
