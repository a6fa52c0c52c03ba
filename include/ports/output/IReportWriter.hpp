#pragma once

#include "domain/LedgerReport.hpp"
#include <string>

namespace navledger::ports::output {

/**
 * @brief Интерфейс вывода отчёта
 *
 * Output Port.
 */
class IReportWriter {
public:
    virtual ~IReportWriter() = default;

    /**
     * @brief Записать отчёт
     *
     * @param report Данные отчёта
     * @param destination Путь к файлу
     */
    virtual void write(const domain::LedgerReport& report, const std::string& destination) = 0;
};

} // namespace navledger::ports::output
