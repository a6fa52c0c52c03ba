#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/LedgerValidationError.hpp"
#include "domain/enums/PnlConvention.hpp"
#include "settings/ConfigFile.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <optional>
#include <string>

namespace navledger::settings {

/**
 * @brief Параметры движка леджера
 *
 * Источники в порядке приоритета (последний побеждает):
 * 1. значения по умолчанию;
 * 2. JSON-файл (путь в NAVLEDGER_CONFIG, иначе ./config.json, если есть);
 * 3. переменные окружения NAVLEDGER_*.
 *
 * Ключи JSON / переменные окружения:
 * - running_total_epoch / NAVLEDGER_RUNNING_TOTAL_EPOCH ("01/19/2023"; null или "none" - без сброса)
 * - pnl_tolerance / NAVLEDGER_PNL_TOLERANCE (0.01)
 * - accrual_tolerance / NAVLEDGER_ACCRUAL_TOLERANCE (0.10, доля суммы транзакции)
 * - valuation_tolerance / NAVLEDGER_VALUATION_TOLERANCE (0.10)
 * - max_correction_iterations / NAVLEDGER_MAX_CORRECTION_ITERATIONS (100)
 * - pnl_convention / NAVLEDGER_PNL_CONVENTION (EXCLUDE_INTEREST_DIVIDENDS)
 */
class LedgerSettings {
public:
    LedgerSettings() : runningTotalEpoch_(domain::CalendarDate(2023, 1, 19)) {}

    /**
     * @brief Загрузить настройки из файла и окружения
     */
    static LedgerSettings load() {
        LedgerSettings settings;
        if (auto config = readConfigFile()) {
            settings.apply(*config);
        }
        settings.applyEnvironment();
        return settings;
    }

    /**
     * @brief Настройки по умолчанию, переопределённые ключами из JSON
     */
    static LedgerSettings fromJson(const nlohmann::json& config) {
        LedgerSettings settings;
        settings.apply(config);
        return settings;
    }

    std::optional<domain::CalendarDate> getRunningTotalEpoch() const { return runningTotalEpoch_; }
    double getPnlTolerance() const { return pnlTolerance_; }
    double getAccrualTolerance() const { return accrualTolerance_; }
    double getValuationTolerance() const { return valuationTolerance_; }
    int getMaxCorrectionIterations() const { return maxCorrectionIterations_; }
    domain::PnlConvention getPnlConvention() const { return pnlConvention_; }

private:
    std::optional<domain::CalendarDate> runningTotalEpoch_;
    double pnlTolerance_ = 0.01;
    double accrualTolerance_ = 0.10;
    double valuationTolerance_ = 0.10;
    int maxCorrectionIterations_ = 100;
    domain::PnlConvention pnlConvention_ = domain::PnlConvention::EXCLUDE_INTEREST_DIVIDENDS;

    void apply(const nlohmann::json& config) {
        if (!config.is_object()) {
            return;
        }
        if (config.contains("running_total_epoch")) {
            const auto& epoch = config.at("running_total_epoch");
            if (epoch.is_null()) {
                runningTotalEpoch_.reset();
            } else {
                setEpoch(epoch.get<std::string>());
            }
        }
        pnlTolerance_ = config.value("pnl_tolerance", pnlTolerance_);
        accrualTolerance_ = config.value("accrual_tolerance", accrualTolerance_);
        valuationTolerance_ = config.value("valuation_tolerance", valuationTolerance_);
        maxCorrectionIterations_ = config.value("max_correction_iterations", maxCorrectionIterations_);
        if (config.contains("pnl_convention")) {
            pnlConvention_ = domain::pnlConventionFromString(config.at("pnl_convention").get<std::string>());
        }
    }

    void applyEnvironment() {
        if (const char* val = std::getenv("NAVLEDGER_RUNNING_TOTAL_EPOCH")) {
            setEpoch(val);
        }
        if (const char* val = std::getenv("NAVLEDGER_PNL_TOLERANCE")) {
            pnlTolerance_ = std::stod(val);
        }
        if (const char* val = std::getenv("NAVLEDGER_ACCRUAL_TOLERANCE")) {
            accrualTolerance_ = std::stod(val);
        }
        if (const char* val = std::getenv("NAVLEDGER_VALUATION_TOLERANCE")) {
            valuationTolerance_ = std::stod(val);
        }
        if (const char* val = std::getenv("NAVLEDGER_MAX_CORRECTION_ITERATIONS")) {
            maxCorrectionIterations_ = std::stoi(val);
        }
        if (const char* val = std::getenv("NAVLEDGER_PNL_CONVENTION")) {
            pnlConvention_ = domain::pnlConventionFromString(val);
        }
    }

    void setEpoch(const std::string& value) {
        if (value.empty() || value == "none") {
            runningTotalEpoch_.reset();
            return;
        }
        auto date = domain::CalendarDate::parse(value);
        if (!date) {
            throw domain::LedgerValidationError("Invalid running_total_epoch: " + value);
        }
        runningTotalEpoch_ = *date;
    }
};

} // namespace navledger::settings
