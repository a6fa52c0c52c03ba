#pragma once

#include "ports/output/IBrokerRecordRepository.hpp"
#include <map>
#include <mutex>

namespace navledger::adapters::secondary {

/**
 * @brief In-memory реализация таблицы broker
 */
class InMemoryBrokerRecordRepository : public ports::output::IBrokerRecordRepository {
public:
    void upsert(const domain::BrokerDayRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[record.date] = record;
    }

    std::optional<domain::BrokerDayRecord> findByDate(const std::string& date) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(date);
        return it != records_.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::BrokerDayRecord> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::BrokerDayRecord> result;
        for (const auto& [date, record] : records_) {
            result.push_back(record);
        }
        return result;
    }

    void deleteAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::BrokerDayRecord> records_;    // Date -> запись
};

} // namespace navledger::adapters::secondary
