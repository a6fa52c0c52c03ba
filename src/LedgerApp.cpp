#include "LedgerApp.hpp"

// Commands (Primary Adapters)
#include "adapters/primary/ConsolePrompt.hpp"
#include "adapters/primary/commands/AddOtherCommand.hpp"
#include "adapters/primary/commands/AddValuationCommand.hpp"
#include "adapters/primary/commands/ClearTableCommand.hpp"
#include "adapters/primary/commands/DeleteValuationCommand.hpp"
#include "adapters/primary/commands/FixDiscrepanciesCommand.hpp"
#include "adapters/primary/commands/ListValuationsCommand.hpp"
#include "adapters/primary/commands/LoadBrokerCommand.hpp"
#include "adapters/primary/commands/LoadOtherCommand.hpp"
#include "adapters/primary/commands/LoadValuationCommand.hpp"
#include "adapters/primary/commands/RebuildCommand.hpp"
#include "adapters/primary/commands/ReportCommand.hpp"

// Application Services
#include "application/DiscrepancyCorrector.hpp"
#include "application/LedgerService.hpp"
#include "application/PnlReconciler.hpp"
#include "application/RecordService.hpp"
#include "application/ReportService.hpp"

// Secondary Adapters
#include "adapters/secondary/decision/AutoConfirmDecider.hpp"
#include "adapters/secondary/decision/TerminalConfirmDecider.hpp"
#include "adapters/secondary/persistence/PostgresBrokerRecordRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"
#include "adapters/secondary/persistence/PostgresOtherTransactionRepository.hpp"
#include "adapters/secondary/persistence/PostgresValuationDateRepository.hpp"
#include "adapters/secondary/report/JsonReportWriter.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <iostream>

namespace di = boost::di;

using namespace navledger;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp() = default;

LedgerApp::~LedgerApp() = default;

int LedgerApp::run(int argc, char* argv[])
{
    try
    {
        loadEnvironment(argc, argv);
    }
    catch (const adapters::primary::UsageError& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return adapters::primary::CliDispatcher::EXIT_USAGE;
    }

    configureInjection();
    return dispatcher_.dispatch(*args_);
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    args_.emplace(argc, argv);

    if (adapters::primary::ReportCommand::writesToStdout(*args_))
    {
        reportStream_ = std::make_unique<std::ostream>(std::cout.rdbuf());
        logRedirect_ = std::make_unique<utils::StreamRedirect>(std::cout, std::cerr);
    }

    std::cout << "[LedgerApp] Application created" << std::endl;
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    dbSettings_ = std::make_shared<settings::DbSettings>(settings::DbSettings::load());
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>(settings::LedgerSettings::load());

    std::cout << "[LedgerApp] Database: " << dbSettings_->getHost() << ":" << dbSettings_->getPort()
              << "/" << dbSettings_->getName() << std::endl;
    std::cout << "[LedgerApp] P&L convention: " << domain::toString(ledgerSettings_->getPnlConvention())
              << ", running total epoch: "
              << (ledgerSettings_->getRunningTotalEpoch()
                      ? ledgerSettings_->getRunningTotalEpoch()->toString()
                      : std::string("none"))
              << std::endl;
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    std::shared_ptr<ports::output::ICorrectionDecider> decider;
    if (args_->hasFlag("--yes"))
    {
        decider = std::make_shared<adapters::secondary::AutoConfirmDecider>();
    }
    else
    {
        decider = std::make_shared<adapters::secondary::TerminalConfirmDecider>();
    }

    auto reportWriter = reportStream_
        ? std::make_shared<adapters::secondary::JsonReportWriter>(*reportStream_)
        : std::make_shared<adapters::secondary::JsonReportWriter>();

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings and Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<settings::DbSettings>().to(dbSettings_),
        di::bind<settings::LedgerSettings>().to(ledgerSettings_),

        di::bind<ports::output::IBrokerRecordRepository>()
            .to<adapters::secondary::PostgresBrokerRecordRepository>()
            .in(di::singleton),

        di::bind<ports::output::IOtherTransactionRepository>()
            .to<adapters::secondary::PostgresOtherTransactionRepository>()
            .in(di::singleton),

        di::bind<ports::output::IValuationDateRepository>()
            .to<adapters::secondary::PostgresValuationDateRepository>()
            .in(di::singleton),

        di::bind<ports::output::ILedgerRepository>()
            .to<adapters::secondary::PostgresLedgerRepository>()
            .in(di::singleton),

        // ICorrectionDecider - терминал или автоподтверждение (--yes)
        di::bind<ports::output::ICorrectionDecider>().to(decider),

        // IReportWriter - stdout отчёта отделён от журнала
        di::bind<ports::output::IReportWriter>().to(reportWriter),

        di::bind<adapters::primary::IUserPrompt>()
            .to<adapters::primary::ConsolePrompt>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<application::PnlReconciler>().in(di::singleton),

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IRecordService>()
            .to<application::RecordService>()
            .in(di::singleton),

        di::bind<ports::input::IDiscrepancyService>()
            .to<application::DiscrepancyCorrector>()
            .in(di::singleton),

        di::bind<ports::input::IReportService>()
            .to<application::ReportService>()
            .in(di::singleton));

    // ========================================================================
    // Layer 3: Primary Adapters (CLI Commands)
    // ========================================================================

    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::LoadBrokerCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::LoadOtherCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::LoadValuationCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::AddOtherCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::AddValuationCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::ListValuationsCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::DeleteValuationCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::ClearTableCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::RebuildCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::FixDiscrepanciesCommand>>());
    dispatcher_.registerCommand(injector.create<std::shared_ptr<adapters::primary::ReportCommand>>());

    std::cout << "[LedgerApp] Boost.DI injector configured, 11 commands registered" << std::endl;
}

void LedgerApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     NAV Ledger - Daily Fund Valuation                ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      PostgreSQL (libpqxx)                  ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
