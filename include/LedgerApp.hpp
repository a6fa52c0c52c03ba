#pragma once

#include "adapters/primary/CliArguments.hpp"
#include "adapters/primary/CliDispatcher.hpp"
#include "utils/StreamRedirect.hpp"
#include <boost/di.hpp>
#include <memory>
#include <optional>
#include <ostream>

// Forward declarations - Settings
namespace navledger::settings {
    class DbSettings;
    class LedgerSettings;
}

/**
 * @class LedgerApp
 * @brief Приложение командной строки NAV Ledger
 *
 * Template Method:
 * 1. loadEnvironment() - разбор аргументов, загрузка DbSettings и LedgerSettings.
 *    Для "report --output -" stdout отдаётся отчёту, журнал пишется в stderr
 * 2. configureInjection() - настройка Boost.DI и регистрация команд
 * 3. dispatch - выполнение команды
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: CSV readers, CLI commands
 * - Secondary Adapters: Postgres* repositories, deciders, JsonReportWriter
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @brief Выполнить команду
     * @return Код выхода процесса (0 / 1 / 2)
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать команды
     *
     * 1. Output Ports -> Postgres адаптеры, решение о корректировке по флагу --yes
     * 2. Input Ports -> Application Services
     * 3. Команды создаются из инжектора
     */
    void configureInjection();

private:
    void printStartupBanner();

    /// Исходный stdout для JSON-отчёта, пока std::cout перенаправлен в stderr
    std::unique_ptr<std::ostream> reportStream_;
    std::unique_ptr<navledger::utils::StreamRedirect> logRedirect_;

    std::optional<navledger::adapters::primary::CliArguments> args_;
    std::shared_ptr<navledger::settings::DbSettings> dbSettings_;
    std::shared_ptr<navledger::settings::LedgerSettings> ledgerSettings_;
    navledger::adapters::primary::CliDispatcher dispatcher_;
};
