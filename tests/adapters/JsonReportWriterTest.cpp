/**
 * @file JsonReportWriterTest.cpp
 * @brief Unit tests for JsonReportWriter
 */

#include <gtest/gtest.h>
#include "adapters/secondary/report/JsonReportWriter.hpp"
#include "utils/StreamRedirect.hpp"
#include "../mocks/TestRecords.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace navledger;
using namespace navledger::adapters::secondary;
using namespace navledger::tests;

class JsonReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        report_.fromDate = "01/01/2023";
        report_.toDate = "01/31/2023";

        domain::LedgerRow row;
        row.date = "01/03/2023";
        row.totalBroker = 1000.0;
        row.startFundValue = 1000.0;
        row.endFundValue = 1000.0;
        row.periodStartingNav = 1000.0;
        row.valuationDate = true;
        report_.overall.push_back(row);

        report_.broker.push_back(brokerRecord("01/03/2023", std::nullopt, 1000.0));
        report_.otherTransactions.push_back(otherTx("01/03/2023", 50.0, true));

        domain::PeriodReturn period;
        period.startDate = "01/03/2023";
        period.endDate = "01/03/2023";
        period.days = 1;
        period.startingNav = 1000.0;
        report_.periodReturns.push_back(period);
    }

    domain::LedgerReport report_;
};

TEST_F(JsonReportWriterTest, ToJson_SheetsAndColumnNames) {
    auto document = JsonReportWriter::toJson(report_);

    EXPECT_EQ(document["from"], "01/01/2023");
    EXPECT_EQ(document["to"], "01/31/2023");

    ASSERT_EQ(document["overall"].size(), 1u);
    const auto& row = document["overall"][0];
    EXPECT_EQ(row["Date"], "01/03/2023");
    EXPECT_TRUE(row["Broker P&L"].is_null());
    EXPECT_DOUBLE_EQ(row["Total Broker"].get<double>(), 1000.0);
    EXPECT_DOUBLE_EQ(row["Period Starting NAV"].get<double>(), 1000.0);
    EXPECT_TRUE(row["Daily Return"].is_null());
    EXPECT_EQ(row["Valuation Date"], true);

    EXPECT_TRUE(document["broker"][0]["P&L"].is_null());
    EXPECT_EQ(document["other_transactions"][0]["Counted in P&L"], true);
    EXPECT_EQ(document["period_returns"][0]["Days"], 1);
    EXPECT_TRUE(document["period_returns"][0]["Cumulative Return"].is_null());
    EXPECT_TRUE(document["pnl_check"].is_array());
    EXPECT_TRUE(document["pnl_check"].empty());
}

TEST_F(JsonReportWriterTest, Write_CreatesParsableFile) {
    auto path = (std::filesystem::temp_directory_path() / "navledger_report_test.json").string();
    JsonReportWriter writer;

    writer.write(report_, path);

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    auto document = nlohmann::json::parse(file);
    EXPECT_EQ(document["overall"].size(), 1u);
    file.close();
    std::remove(path.c_str());
}

TEST_F(JsonReportWriterTest, Write_UnwritablePathThrows) {
    JsonReportWriter writer;

    EXPECT_THROW(writer.write(report_, "/nonexistent-dir/report.json"), std::runtime_error);
}

TEST_F(JsonReportWriterTest, Write_StdoutReportIsParsableWhileLogsAreRedirected) {
    std::ostringstream reportOut;
    std::ostringstream logOut;
    JsonReportWriter writer(reportOut);

    {
        utils::StreamRedirect redirect(std::cout, logOut);
        std::cout << "[LedgerApp] Application created" << std::endl;
        writer.write(report_, "-");
        std::cout << "[ReportService] Report done" << std::endl;
    }

    auto document = nlohmann::json::parse(reportOut.str());
    EXPECT_EQ(document["from"], "01/01/2023");
    EXPECT_EQ(document["overall"].size(), 1u);
    EXPECT_NE(logOut.str().find("[LedgerApp] Application created"), std::string::npos);
    EXPECT_EQ(logOut.str().find("\"overall\""), std::string::npos);
}

TEST_F(JsonReportWriterTest, IsStdout_DashAndEmpty) {
    EXPECT_TRUE(JsonReportWriter::isStdout("-"));
    EXPECT_TRUE(JsonReportWriter::isStdout(""));
    EXPECT_FALSE(JsonReportWriter::isStdout("ledger_report.json"));
}
