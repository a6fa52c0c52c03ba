/**
 * @file InMemoryRepositoryTest.cpp
 * @brief Unit tests for in-memory repositories
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryBrokerRecordRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOtherTransactionRepository.hpp"
#include "adapters/secondary/persistence/InMemoryValuationDateRepository.hpp"
#include "../mocks/TestRecords.hpp"

using namespace navledger;
using namespace navledger::adapters::secondary;
using namespace navledger::tests;

TEST(InMemoryBrokerRecordRepositoryTest, UpsertReplacesByDate) {
    InMemoryBrokerRecordRepository repo;

    repo.upsert(brokerRecord("01/03/2023", 10.0, 1000.0));
    repo.upsert(brokerRecord("01/03/2023", 20.0, 1010.0));

    EXPECT_EQ(repo.count(), 1u);
    EXPECT_DOUBLE_EQ(repo.findByDate("01/03/2023")->pnl.value(), 20.0);
    EXPECT_FALSE(repo.findByDate("01/04/2023").has_value());

    repo.deleteAll();
    EXPECT_TRUE(repo.findAll().empty());
}

TEST(InMemoryOtherTransactionRepositoryTest, KeyIncludesAmount) {
    InMemoryOtherTransactionRepository repo;

    EXPECT_EQ(repo.save(otherTx("01/15/2023", 500.0)), domain::SaveOutcome::INSERTED);
    EXPECT_EQ(repo.save(otherTx("01/15/2023", 500.01)), domain::SaveOutcome::INSERTED);
    EXPECT_EQ(repo.save(otherTx("01/15/2023", 500.0, true, true)), domain::SaveOutcome::UPDATED);

    auto stored = repo.findByDate("01/15/2023");
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].id, 1);
    EXPECT_EQ(stored[1].id, 2);
    EXPECT_TRUE(stored[0].countedInPnl);
    EXPECT_TRUE(stored[0].overnight);
}

TEST(InMemoryOtherTransactionRepositoryTest, DescriptionsArePartOfKey) {
    InMemoryOtherTransactionRepository repo;

    repo.save(otherTx("01/15/2023", 500.0, false, false, "Transfer"));
    repo.save(otherTx("01/15/2023", 500.0, false, false, "Fee refund"));

    EXPECT_EQ(repo.count(), 2u);
}

TEST(InMemoryValuationDateRepositoryTest, DeleteReportsPresence) {
    InMemoryValuationDateRepository repo;
    repo.upsert(valuation("01/31/2023", std::nullopt));

    EXPECT_TRUE(repo.deleteByDate("01/31/2023"));
    EXPECT_FALSE(repo.deleteByDate("01/31/2023"));
    EXPECT_TRUE(repo.findAll().empty());
}

TEST(InMemoryLedgerRepositoryTest, ReplaceAllSwapsContents) {
    InMemoryLedgerRepository repo;
    domain::LedgerRow first;
    first.date = "01/03/2023";
    domain::LedgerRow second;
    second.date = "01/04/2023";

    repo.replaceAll({first, second});
    repo.replaceAll({second});

    auto rows = repo.findAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].date, "01/04/2023");
    EXPECT_EQ(repo.getReplaceCount(), 2);
}
