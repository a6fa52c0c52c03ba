#pragma once

#include "ports/output/IValuationDateRepository.hpp"
#include <map>
#include <mutex>

namespace navledger::adapters::secondary {

/**
 * @brief In-memory реализация таблицы valuation_dates
 */
class InMemoryValuationDateRepository : public ports::output::IValuationDateRepository {
public:
    void upsert(const domain::ValuationOverride& valuation) override {
        std::lock_guard<std::mutex> lock(mutex_);
        valuations_[valuation.date] = valuation;
    }

    std::optional<domain::ValuationOverride> findByDate(const std::string& date) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = valuations_.find(date);
        return it != valuations_.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::ValuationOverride> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::ValuationOverride> result;
        for (const auto& [date, valuation] : valuations_) {
            result.push_back(valuation);
        }
        return result;
    }

    bool deleteByDate(const std::string& date) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return valuations_.erase(date) > 0;
    }

    void deleteAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        valuations_.clear();
    }

private:
    std::mutex mutex_;
    std::map<std::string, domain::ValuationOverride> valuations_;
};

} // namespace navledger::adapters::secondary
