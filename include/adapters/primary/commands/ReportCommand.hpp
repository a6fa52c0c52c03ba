#pragma once

#include "adapters/primary/ICliCommand.hpp"
#include "ports/input/IReportService.hpp"
#include "ports/output/IReportWriter.hpp"
#include <iostream>
#include <memory>

namespace navledger::adapters::primary {

/**
 * @brief report <from> <to> [--output FILE]
 *
 * Без --output отчёт пишется в ledger_report.json, "--output -" - в stdout.
 */
class ReportCommand : public ICliCommand {
public:
    static constexpr const char* DEFAULT_OUTPUT = "ledger_report.json";
    static constexpr const char* STDOUT_OUTPUT = "-";

    /**
     * @brief Отчёт пойдёт в stdout: журнал приложения нужно увести в stderr
     */
    static bool writesToStdout(const CliArguments& args) {
        if (args.command() != "report") {
            return false;
        }
        auto output = args.option("--output");
        return output && (output->empty() || *output == STDOUT_OUTPUT);
    }

    ReportCommand(
        std::shared_ptr<ports::input::IReportService> reportService,
        std::shared_ptr<ports::output::IReportWriter> reportWriter
    ) : reportService_(std::move(reportService))
      , reportWriter_(std::move(reportWriter)) {}

    std::vector<std::string> names() const override { return {"report"}; }

    std::string usage() const override { return "report <from> <to> [--output FILE]"; }

    int execute(const CliArguments& args) override {
        auto report = reportService_->buildReport(args.positional(0, "from"), args.positional(1, "to"));
        reportWriter_->write(report, args.option("--output").value_or(DEFAULT_OUTPUT));

        if (!report.pnlCheck.empty()) {
            std::cerr << "WARNING: " << report.pnlCheck.size()
                      << " broker P&L discrepancies detected, please review the data" << std::endl;
        }
        return 0;
    }

private:
    std::shared_ptr<ports::input::IReportService> reportService_;
    std::shared_ptr<ports::output::IReportWriter> reportWriter_;
};

} // namespace navledger::adapters::primary
