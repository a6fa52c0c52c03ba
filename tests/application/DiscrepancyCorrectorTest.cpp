/**
 * @file DiscrepancyCorrectorTest.cpp
 * @brief Unit tests for DiscrepancyCorrector
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/DiscrepancyCorrector.hpp"
#include "application/LedgerService.hpp"
#include "adapters/secondary/persistence/InMemoryBrokerRecordRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOtherTransactionRepository.hpp"
#include "adapters/secondary/persistence/InMemoryValuationDateRepository.hpp"
#include "../mocks/CountingLedgerService.hpp"
#include "../mocks/MockCorrectionDecider.hpp"
#include "../mocks/TestRecords.hpp"

using namespace navledger;
using namespace navledger::application;
using namespace navledger::adapters::secondary;
using namespace navledger::tests;
using ::testing::_;
using ::testing::DoubleNear;
using ::testing::Field;
using ::testing::Return;

namespace {

/**
 * @brief Репозиторий, в котором любой ключ уже существует
 */
class ExistingKeyOtherTransactionRepository : public InMemoryOtherTransactionRepository {
public:
    domain::SaveOutcome save(const domain::OtherTransaction&) override {
        return domain::SaveOutcome::UPDATED;
    }
};

} // namespace

class DiscrepancyCorrectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        brokerRepo_ = std::make_shared<InMemoryBrokerRecordRepository>();
        otherRepo_ = std::make_shared<InMemoryOtherTransactionRepository>();
        valuationRepo_ = std::make_shared<InMemoryValuationDateRepository>();
        ledgerRepo_ = std::make_shared<InMemoryLedgerRepository>();
        decider_ = std::make_shared<MockCorrectionDecider>();

        brokerRepo_->upsert(brokerRecord("01/30/2023", 0.0, 1000.0));
        brokerRepo_->upsert(brokerRecord("01/31/2023", 0.0, 1000.0));
    }

    void createCorrector(int maxIterations = 100) {
        createCorrector(otherRepo_, maxIterations);
    }

    void createCorrector(std::shared_ptr<ports::output::IOtherTransactionRepository> otherRepo,
                         int maxIterations = 100) {
        auto settings = std::make_shared<settings::LedgerSettings>(
            settings::LedgerSettings::fromJson({
                {"running_total_epoch", nullptr},
                {"max_correction_iterations", maxIterations}
            }));
        auto ledger = std::make_shared<LedgerService>(
            brokerRepo_, otherRepo, valuationRepo_, ledgerRepo_, settings);
        ledgerService_ = std::make_shared<CountingLedgerService>(ledger);
        corrector_ = std::make_unique<DiscrepancyCorrector>(
            ledgerService_, valuationRepo_, otherRepo, decider_, settings);
    }

    std::shared_ptr<InMemoryBrokerRecordRepository> brokerRepo_;
    std::shared_ptr<InMemoryOtherTransactionRepository> otherRepo_;
    std::shared_ptr<InMemoryValuationDateRepository> valuationRepo_;
    std::shared_ptr<InMemoryLedgerRepository> ledgerRepo_;
    std::shared_ptr<MockCorrectionDecider> decider_;
    std::shared_ptr<CountingLedgerService> ledgerService_;
    std::unique_ptr<DiscrepancyCorrector> corrector_;
};

// ============================================================================
// DETECTION
// ============================================================================

TEST_F(DiscrepancyCorrectorTest, DeltaOfTenCents_WithinTolerance) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.10));
    createCorrector();
    EXPECT_CALL(*decider_, confirm(_, _)).Times(0);

    auto result = corrector_->correctDiscrepancies(false);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, domain::CorrectionStatus::CONVERGED);
    EXPECT_EQ(result.correctionsApplied, 0);
    EXPECT_EQ(otherRepo_->count(), 0u);
}

TEST_F(DiscrepancyCorrectorTest, DeltaOfElevenCents_Detected) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector();
    ledgerService_->rebuildLedger();

    auto found = corrector_->detectDiscrepancies();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].valuationDate, "01/31/2023");
    EXPECT_EQ(found[0].previousDate, "01/30/2023");
    EXPECT_DOUBLE_EQ(found[0].expected, 1000.0);
    EXPECT_DOUBLE_EQ(found[0].recorded, 1000.11);
    EXPECT_NEAR(found[0].delta, -0.11, 1e-9);
}

TEST_F(DiscrepancyCorrectorTest, FindDiscrepancies_FirstRowNeverCompared) {
    domain::LedgerRow first;
    first.date = "01/03/2023";
    first.startFundValue = 5000.0;
    first.endFundValue = 1000.0;

    domain::LedgerRow second;
    second.date = "01/04/2023";
    second.startFundValue = 1200.0;

    EXPECT_TRUE(DiscrepancyCorrector::findDiscrepancies({first, second}, {}, 0.10).empty());

    auto found = DiscrepancyCorrector::findDiscrepancies(
        {first, second}, {domain::CalendarDate(2023, 1, 4)}, 0.10);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].delta, -200.0);
}

TEST_F(DiscrepancyCorrectorTest, MakeCorrection_OvernightOnPreviousDay) {
    domain::Discrepancy discrepancy;
    discrepancy.valuationDate = "02/01/2023";
    discrepancy.previousDate = "01/31/2023";
    discrepancy.expected = 1000.0;
    discrepancy.recorded = 1250.0;
    discrepancy.delta = -250.0;

    auto tx = DiscrepancyCorrector::makeCorrection(discrepancy);

    EXPECT_EQ(tx.date, "01/31/2023");
    EXPECT_DOUBLE_EQ(tx.amount, 250.0);
    EXPECT_EQ(tx.accountDescription, "Correction");
    EXPECT_EQ(tx.transactionDescription, "Valuation Correction");
    EXPECT_TRUE(tx.overnight);
    EXPECT_FALSE(tx.countedInPnl);
}

// ============================================================================
// CORRECTION LOOP
// ============================================================================

TEST_F(DiscrepancyCorrectorTest, ApprovedCorrection_Converges) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector();
    EXPECT_CALL(*decider_, confirm(_, Field(&domain::OtherTransaction::amount, DoubleNear(0.11, 1e-9))))
        .WillOnce(Return(true));

    auto result = corrector_->correctDiscrepancies(false);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, domain::CorrectionStatus::CONVERGED);
    EXPECT_EQ(result.correctionsApplied, 1);
    EXPECT_EQ(ledgerService_->rebuildCallCount(), 2);

    auto stored = otherRepo_->findByDate("01/30/2023");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_TRUE(stored[0].overnight);
    EXPECT_FALSE(stored[0].countedInPnl);
    EXPECT_EQ(stored[0].additionalInfo, "Automatic correction for valuation discrepancy");

    EXPECT_TRUE(corrector_->detectDiscrepancies().empty());
}

TEST_F(DiscrepancyCorrectorTest, AutoConfirm_DeciderNotAsked) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector();
    EXPECT_CALL(*decider_, confirm(_, _)).Times(0);

    auto result = corrector_->correctDiscrepancies(true);

    EXPECT_EQ(result.status, domain::CorrectionStatus::CONVERGED);
    EXPECT_EQ(result.correctionsApplied, 1);
    ASSERT_EQ(result.appliedCorrections.size(), 1u);
    EXPECT_EQ(result.appliedCorrections[0].date, "01/30/2023");
}

TEST_F(DiscrepancyCorrectorTest, DeclinedCorrection_StopsWithoutWriting) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector();
    EXPECT_CALL(*decider_, confirm(_, _)).WillOnce(Return(false));

    auto result = corrector_->correctDiscrepancies(false);

    EXPECT_EQ(result.status, domain::CorrectionStatus::DECLINED);
    EXPECT_EQ(result.correctionsApplied, 0);
    EXPECT_EQ(result.remaining.size(), 1u);
    EXPECT_EQ(otherRepo_->count(), 0u);
}

TEST_F(DiscrepancyCorrectorTest, ExistingCorrectionKey_ReportedAsAlreadyCorrected) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector(std::make_shared<ExistingKeyOtherTransactionRepository>());

    auto result = corrector_->correctDiscrepancies(true);

    EXPECT_EQ(result.status, domain::CorrectionStatus::ALREADY_CORRECTED);
    EXPECT_EQ(result.correctionsApplied, 0);
    EXPECT_EQ(result.remaining.size(), 1u);
}

TEST_F(DiscrepancyCorrectorTest, TwoDiscrepancies_CorrectedOneAtATime) {
    brokerRepo_->upsert(brokerRecord("02/14/2023", 0.0, 1000.0));
    brokerRepo_->upsert(brokerRecord("02/15/2023", 0.0, 1000.0));
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    valuationRepo_->upsert(valuation("02/15/2023", 2000.0));
    createCorrector();

    auto result = corrector_->correctDiscrepancies(true);

    EXPECT_EQ(result.status, domain::CorrectionStatus::CONVERGED);
    ASSERT_EQ(result.correctionsApplied, 2);
    EXPECT_EQ(result.appliedCorrections[0].date, "01/30/2023");
    EXPECT_EQ(result.appliedCorrections[1].date, "02/14/2023");
    EXPECT_NEAR(result.appliedCorrections[1].amount, 999.89, 1e-6);
    EXPECT_TRUE(corrector_->detectDiscrepancies().empty());
}

TEST_F(DiscrepancyCorrectorTest, IterationLimit_ReportsRemaining) {
    brokerRepo_->upsert(brokerRecord("02/14/2023", 0.0, 1000.0));
    brokerRepo_->upsert(brokerRecord("02/15/2023", 0.0, 1000.0));
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    valuationRepo_->upsert(valuation("02/15/2023", 2000.0));
    createCorrector(1);

    auto result = corrector_->correctDiscrepancies(true);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, domain::CorrectionStatus::MAX_ITERATIONS_REACHED);
    EXPECT_EQ(result.iterations, 1);
    EXPECT_EQ(result.correctionsApplied, 1);
    ASSERT_EQ(result.remaining.size(), 1u);
    EXPECT_EQ(result.remaining[0].valuationDate, "02/15/2023");
}

TEST_F(DiscrepancyCorrectorTest, IterationLimit_LastCorrectionResolves) {
    valuationRepo_->upsert(valuation("01/31/2023", 1000.11));
    createCorrector(1);

    auto result = corrector_->correctDiscrepancies(true);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, domain::CorrectionStatus::CONVERGED);
    EXPECT_EQ(result.correctionsApplied, 1);
}
