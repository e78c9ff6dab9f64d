#include <gtest/gtest.h>
#include "CorporateActionAdjuster.hpp"
#include "DateUtils.hpp"
#include <cmath>
#include <limits>

using namespace taxlot;

namespace {

CorporateAction makeSplit(const std::string& symbol, Date effective, double from, double to)
{
    CorporateAction action;
    action.symbol = symbol;
    action.actionType = CorporateActionType::Split;
    action.effectiveDate = effective;
    action.ratioFrom = from;
    action.ratioTo = to;
    return action;
}

Lot makeLot(double quantity, Date date, double gross, double net)
{
    return Lot{quantity, date, gross, net, ""};
}

}  // namespace

class CorporateActionAdjusterTest : public ::testing::Test {
protected:
    Date jan = makeDate(2023, 1, 10);
    Date jun = makeDate(2023, 6, 1);
    Date splitDate = makeDate(2023, 3, 1);
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Пересчет очереди
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CorporateActionAdjusterTest, SplitRescalesLotsBeforeEffectiveDate) {
    LotQueue lots{makeLot(10.0, jan, 100.0, 101.0), makeLot(5.0, jun, 60.0, 60.0)};

    auto adjusted = CorporateActionAdjuster::adjust(lots, makeSplit("AAA", splitDate, 1.0, 2.0));

    ASSERT_TRUE(adjusted.has_value());
    ASSERT_EQ(adjusted->size(), 2u);

    EXPECT_DOUBLE_EQ((*adjusted)[0].quantity, 20.0);
    EXPECT_DOUBLE_EQ((*adjusted)[0].grossUnitPrice, 50.0);
    EXPECT_DOUBLE_EQ((*adjusted)[0].netUnitPrice, 50.5);

    // Лот после даты сплита не меняется
    EXPECT_DOUBLE_EQ((*adjusted)[1].quantity, 5.0);
    EXPECT_DOUBLE_EQ((*adjusted)[1].grossUnitPrice, 60.0);
}

TEST_F(CorporateActionAdjusterTest, SplitPreservesLotValue) {
    LotQueue lots{makeLot(7.0, jan, 33.3, 34.1)};

    auto adjusted = CorporateActionAdjuster::adjust(lots, makeSplit("AAA", splitDate, 2.0, 5.0));

    ASSERT_TRUE(adjusted.has_value());
    EXPECT_NEAR((*adjusted)[0].quantity * (*adjusted)[0].netUnitPrice, 7.0 * 34.1, 1e-9);
    EXPECT_NEAR((*adjusted)[0].quantity * (*adjusted)[0].grossUnitPrice, 7.0 * 33.3, 1e-9);
}

TEST_F(CorporateActionAdjusterTest, LotOnEffectiveDateIsNotAdjusted) {
    LotQueue lots{makeLot(10.0, splitDate, 100.0, 100.0)};

    auto adjusted = CorporateActionAdjuster::adjust(lots, makeSplit("AAA", splitDate, 1.0, 2.0));

    ASSERT_TRUE(adjusted.has_value());
    EXPECT_DOUBLE_EQ((*adjusted)[0].quantity, 10.0);
}

TEST_F(CorporateActionAdjusterTest, InvalidRatioIsRejected) {
    LotQueue lots{makeLot(10.0, jan, 100.0, 100.0)};

    EXPECT_FALSE(CorporateActionAdjuster::adjust(lots, makeSplit("AAA", splitDate, 0.0, 2.0)));
    EXPECT_FALSE(CorporateActionAdjuster::adjust(lots, makeSplit("AAA", splitDate, 1.0, -2.0)));
    EXPECT_FALSE(CorporateActionAdjuster::adjust(
        lots, makeSplit("AAA", splitDate, std::numeric_limits<double>::quiet_NaN(), 2.0)));
}

TEST_F(CorporateActionAdjusterTest, NonSplitTypeIsRejected) {
    auto action = makeSplit("AAA", splitDate, 1.0, 2.0);
    action.actionType = CorporateActionType::Bonus;

    auto reason = CorporateActionAdjuster::skipReason(action);

    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("BONUS"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Применение по времени
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CorporateActionAdjusterTest, SkippedActionsAreRecorded) {
    auto bonus = makeSplit("AAA", splitDate, 1.0, 2.0);
    bonus.actionType = CorporateActionType::Bonus;

    auto inactive = makeSplit("AAA", splitDate, 1.0, 2.0);
    inactive.active = false;

    CorporateActionAdjuster adjuster({
        bonus,
        makeSplit("BBB", splitDate, 0.0, 2.0),
        inactive
    });

    // Неактивное действие игнорируется без диагностики
    ASSERT_EQ(adjuster.skipped().size(), 2u);
    EXPECT_EQ(adjuster.skipped()[0].symbol, "AAA");
    EXPECT_EQ(adjuster.skipped()[0].actionType, CorporateActionType::Bonus);
    EXPECT_EQ(adjuster.skipped()[1].symbol, "BBB");
    EXPECT_FALSE(adjuster.hasPending());
}

TEST_F(CorporateActionAdjusterTest, ApplyPendingRespectsHorizonAndAppliesOnce) {
    LotLedger ledger;
    ledger.addLot("AAA", makeLot(10.0, jan, 100.0, 100.0));

    CorporateActionAdjuster adjuster({makeSplit("AAA", splitDate, 1.0, 2.0)});

    EXPECT_EQ(adjuster.applyPending(ledger, makeDate(2023, 2, 28)), 0u);
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 10.0);

    EXPECT_EQ(adjuster.applyPending(ledger, splitDate), 1u);
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 20.0);

    // Повторный вызов не применяет сплит снова
    EXPECT_EQ(adjuster.applyPending(ledger, jun), 0u);
    EXPECT_EQ(adjuster.applyAll(ledger), 0u);
    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 20.0);
}

TEST_F(CorporateActionAdjusterTest, ActionsApplyInDateOrder) {
    LotLedger ledger;
    ledger.addLot("AAA", makeLot(10.0, jan, 120.0, 120.0));
    ledger.addLot("AAA", makeLot(1.0, makeDate(2023, 4, 1), 40.0, 40.0));

    // Во входе позже идет более ранний сплит
    CorporateActionAdjuster adjuster({
        makeSplit("AAA", makeDate(2023, 5, 1), 1.0, 3.0),
        makeSplit("AAA", splitDate, 1.0, 2.0)
    });

    adjuster.applyAll(ledger);

    const auto& lots = ledger.lots("AAA");
    ASSERT_EQ(lots.size(), 2u);
    EXPECT_DOUBLE_EQ(lots[0].quantity, 60.0);
    EXPECT_DOUBLE_EQ(lots[0].grossUnitPrice, 20.0);
    EXPECT_DOUBLE_EQ(lots[1].quantity, 3.0);
    EXPECT_NEAR(lots[1].grossUnitPrice, 40.0 / 3.0, 1e-9);
}

TEST_F(CorporateActionAdjusterTest, ActionForUnknownSymbolIsNoop) {
    LotLedger ledger;
    ledger.addLot("AAA", makeLot(10.0, jan, 100.0, 100.0));

    CorporateActionAdjuster adjuster({makeSplit("ZZZ", splitDate, 1.0, 2.0)});
    adjuster.applyAll(ledger);

    EXPECT_DOUBLE_EQ(ledger.totalQuantity("AAA"), 10.0);
    EXPECT_FALSE(ledger.hasSymbol("ZZZ"));
    EXPECT_TRUE(adjuster.skipped().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
