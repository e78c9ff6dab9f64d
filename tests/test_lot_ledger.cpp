#include <gtest/gtest.h>
#include "LotLedger.hpp"
#include "DateUtils.hpp"

using namespace taxlot;

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные функции
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

Lot makeLot(double quantity, int year, unsigned month, unsigned day, double price,
            const std::string& tradeId = "")
{
    return Lot{quantity, makeDate(year, month, day), price, price, tradeId};
}

}  // namespace

class LotLedgerTest : public ::testing::Test {
protected:
    LotLedger ledger;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Добавление лотов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LotLedgerTest, EmptyLedger) {
    EXPECT_FALSE(ledger.hasSymbol("AAA"));
    EXPECT_TRUE(ledger.lots("AAA").empty());
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 0.0);
    EXPECT_FALSE(ledger.averageCost("AAA").has_value());
    EXPECT_TRUE(ledger.symbols().empty());
}

TEST_F(LotLedgerTest, AddLotsKeepsInsertionOrder) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0, "T1"));
    ledger.addLot("AAA", makeLot(5.0, 2023, 6, 1, 120.0, "T2"));

    const auto& lots = ledger.lots("AAA");
    ASSERT_EQ(lots.size(), 2u);
    EXPECT_EQ(lots[0].tradeId, "T1");
    EXPECT_EQ(lots[1].tradeId, "T2");
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 15.0);
}

TEST_F(LotLedgerTest, AverageCostUsesNetPrice) {
    Lot lot = makeLot(10.0, 2023, 1, 10, 100.0);
    lot.netUnitPrice = 101.0;
    ledger.addLot("AAA", lot);
    ledger.addLot("AAA", makeLot(10.0, 2023, 2, 10, 121.0));

    auto avg = ledger.averageCost("AAA");
    ASSERT_TRUE(avg.has_value());
    EXPECT_DOUBLE_EQ(*avg, 111.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Списание FIFO
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LotLedgerTest, ConsumeTakesOldestLotFirst) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0, "T1"));
    ledger.addLot("AAA", makeLot(10.0, 2023, 6, 1, 120.0, "T2"));

    auto match = ledger.consume("AAA", 15.0);

    ASSERT_EQ(match.slices.size(), 2u);
    EXPECT_EQ(match.slices[0].tradeId, "T1");
    EXPECT_DOUBLE_EQ(match.slices[0].quantity, 10.0);
    EXPECT_EQ(match.slices[1].tradeId, "T2");
    EXPECT_DOUBLE_EQ(match.slices[1].quantity, 5.0);
    EXPECT_DOUBLE_EQ(match.matchedQuantity, 15.0);
    EXPECT_DOUBLE_EQ(match.unmatchedQuantity, 0.0);
    EXPECT_TRUE(match.fullyMatched(kLedgerEpsilon));

    // Первый лот удален, от второго осталось 5
    const auto& lots = ledger.lots("AAA");
    ASSERT_EQ(lots.size(), 1u);
    EXPECT_EQ(lots[0].tradeId, "T2");
    EXPECT_DOUBLE_EQ(lots[0].quantity, 5.0);
}

TEST_F(LotLedgerTest, ConsumeMoreThanAvailableReportsUnmatched) {
    ledger.addLot("AAA", makeLot(4.0, 2023, 1, 10, 100.0));

    auto match = ledger.consume("AAA", 10.0);

    EXPECT_DOUBLE_EQ(match.matchedQuantity, 4.0);
    EXPECT_DOUBLE_EQ(match.unmatchedQuantity, 6.0);
    EXPECT_FALSE(match.fullyMatched(kLedgerEpsilon));
    EXPECT_TRUE(ledger.lots("AAA").empty());
}

TEST_F(LotLedgerTest, ConsumeUnknownSymbolIsFullyUnmatched) {
    auto match = ledger.consume("ZZZ", 3.0);

    EXPECT_TRUE(match.slices.empty());
    EXPECT_DOUBLE_EQ(match.matchedQuantity, 0.0);
    EXPECT_DOUBLE_EQ(match.unmatchedQuantity, 3.0);
}

TEST_F(LotLedgerTest, RemainderBelowEpsilonDropsLot) {
    ledger.addLot("AAA", makeLot(10.00005, 2023, 1, 10, 100.0));

    auto match = ledger.consume("AAA", 10.0);

    EXPECT_TRUE(match.fullyMatched(kLedgerEpsilon));
    EXPECT_TRUE(ledger.lots("AAA").empty());
}

TEST_F(LotLedgerTest, TinyResidualSellIsIgnored) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0));

    auto match = ledger.consume("AAA", 0.00001);

    EXPECT_TRUE(match.slices.empty());
    EXPECT_DOUBLE_EQ(match.unmatchedQuantity, 0.0);
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 10.0);
}

TEST_F(LotLedgerTest, SymbolsAreIndependent) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0));
    ledger.addLot("BBB", makeLot(7.0, 2023, 1, 10, 50.0));

    ledger.consume("AAA", 10.0);

    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 0.0);
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("BBB"), 7.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Снимок и замена очереди
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LotLedgerTest, SnapshotKeepsEmptySymbols) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0));
    ledger.addLot("BBB", makeLot(7.0, 2023, 1, 10, 50.0));
    ledger.consume("AAA", 10.0);

    auto holdings = ledger.snapshot();

    ASSERT_EQ(holdings.size(), 2u);
    EXPECT_TRUE(holdings.at("AAA").empty());
    ASSERT_EQ(holdings.at("BBB").size(), 1u);
    EXPECT_DOUBLE_EQ(holdings.at("BBB")[0].quantity, 7.0);
}

TEST_F(LotLedgerTest, ReplaceLots) {
    ledger.addLot("AAA", makeLot(10.0, 2023, 1, 10, 100.0));

    LotQueue replacement{makeLot(20.0, 2023, 1, 10, 50.0)};
    ledger.replaceLots("AAA", replacement);

    ASSERT_EQ(ledger.lots("AAA").size(), 1u);
    EXPECT_DOUBLE_EQ(ledger.lots("AAA")[0].quantity, 20.0);
    EXPECT_DOUBLE_EQ(ledger.lots("AAA")[0].grossUnitPrice, 50.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
