#pragma once

#include "domain/LedgerValidationError.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace navledger::settings {

/**
 * @brief Прочитать JSON-файл конфигурации
 *
 * Путь берётся из NAVLEDGER_CONFIG, иначе ./config.json. Отсутствие
 * файла по умолчанию не ошибка, отсутствие явно заданного - ошибка.
 *
 * @throws LedgerValidationError файл из NAVLEDGER_CONFIG не найден
 */
inline std::optional<nlohmann::json> readConfigFile() {
    std::string path = "config.json";
    bool explicitPath = false;
    if (const char* value = std::getenv("NAVLEDGER_CONFIG")) {
        path = value;
        explicitPath = true;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        if (explicitPath) {
            throw domain::LedgerValidationError("Config file not found: " + path);
        }
        return std::nullopt;
    }

    std::cout << "[Settings] Loading " << path << std::endl;
    return nlohmann::json::parse(file);
}

} // namespace navledger::settings
