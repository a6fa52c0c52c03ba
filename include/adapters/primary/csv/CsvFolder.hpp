#pragma once

#include "domain/LedgerValidationError.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace navledger::adapters::primary {

/**
 * @brief Все *.csv файлы каталога (без рекурсии), по имени
 */
inline std::vector<std::string> listCsvFiles(const std::string& directory) {
    namespace fs = std::filesystem;

    if (!fs::is_directory(directory)) {
        throw domain::LedgerValidationError("Not a directory: " + directory);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string extension = entry.path().extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (extension == ".csv") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace navledger::adapters::primary
