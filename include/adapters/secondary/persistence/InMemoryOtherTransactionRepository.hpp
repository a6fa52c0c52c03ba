#pragma once

#include "ports/output/IOtherTransactionRepository.hpp"
#include <algorithm>
#include <mutex>

namespace navledger::adapters::secondary {

/**
 * @brief In-memory реализация таблицы other_transactions
 *
 * Уникальный ключ (Date, Account Description, Transaction Description, Amount):
 * повторное сохранение обновляет флаги и Additional Info существующей строки.
 */
class InMemoryOtherTransactionRepository : public ports::output::IOtherTransactionRepository {
public:
    domain::SaveOutcome save(const domain::OtherTransaction& transaction) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(transactions_.begin(), transactions_.end(),
            [&transaction](const domain::OtherTransaction& t) { return t.sameKey(transaction); });

        if (it != transactions_.end()) {
            it->countedInPnl = transaction.countedInPnl;
            it->overnight = transaction.overnight;
            it->additionalInfo = transaction.additionalInfo;
            return domain::SaveOutcome::UPDATED;
        }

        domain::OtherTransaction stored = transaction;
        stored.id = ++lastId_;
        transactions_.push_back(stored);
        return domain::SaveOutcome::INSERTED;
    }

    std::vector<domain::OtherTransaction> findByDate(const std::string& date) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::OtherTransaction> result;
        std::copy_if(transactions_.begin(), transactions_.end(), std::back_inserter(result),
            [&date](const domain::OtherTransaction& t) { return t.date == date; });
        return result;
    }

    std::vector<domain::OtherTransaction> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return transactions_;
    }

    void deleteAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        transactions_.clear();
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transactions_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::OtherTransaction> transactions_;    // в порядке вставки
    int64_t lastId_ = 0;
};

} // namespace navledger::adapters::secondary
