#include "FifoMatcher.hpp"
#include "LotLedger.hpp"
#include "CorporateActionAdjuster.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace taxlot {

std::size_t dropInvalidTrades(std::vector<Trade>& trades)
{
    auto before = trades.size();
    trades.erase(
        std::remove_if(trades.begin(), trades.end(),
            [](const Trade& t) { return !(t.quantity > 0.0) || !std::isfinite(t.quantity); }),
        trades.end());
    return before - trades.size();
}

void sortChronologically(std::vector<AllocatedTrade>& trades, TieBreak tieBreak)
{
    if (tieBreak == TieBreak::TradeId) {
        std::stable_sort(trades.begin(), trades.end(),
            [](const AllocatedTrade& a, const AllocatedTrade& b) {
                if (a.trade.date != b.trade.date) {
                    return a.trade.date < b.trade.date;
                }
                return a.trade.tradeId < b.trade.tradeId;
            });
        return;
    }

    std::stable_sort(trades.begin(), trades.end(),
        [](const AllocatedTrade& a, const AllocatedTrade& b) {
            return a.trade.date < b.trade.date;
        });
}

double averageUnitPrice(const std::vector<Lot>& lots) noexcept
{
    double qty = 0.0;
    double cost = 0.0;
    for (const auto& lot : lots) {
        qty += lot.quantity;
        cost += lot.quantity * lot.netUnitPrice;
    }
    return qty > 0.0 ? cost / qty : 0.0;
}

double totalQuantity(const std::vector<Lot>& lots) noexcept
{
    double qty = 0.0;
    for (const auto& lot : lots) {
        qty += lot.quantity;
    }
    return qty;
}

// ═══════════════════════════════════════════════════════════════════════════════
// FifoMatcher
// ═══════════════════════════════════════════════════════════════════════════════

FifoMatcher::FifoMatcher(MatchOptions options)
    : options_(options)
{
}

MatchResult FifoMatcher::run(
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions,
    std::optional<Date> upTo) const
{
    MatchResult result;

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 1: Фильтрация и распределение комиссий
    // ═════════════════════════════════════════════════════════════════════════

    std::vector<Trade> filtered = trades;
    result.droppedTrades = dropInvalidTrades(filtered);
    if (result.droppedTrades > 0) {
        std::cerr << "⚠ Warning: dropped " << result.droppedTrades
                  << " trade(s) with non-positive quantity" << std::endl;
    }

    if (upTo) {
        filtered.erase(
            std::remove_if(filtered.begin(), filtered.end(),
                [&upTo](const Trade& t) { return t.date > *upTo; }),
            filtered.end());
    }

    auto allocated = allocateCharges(filtered, dailyCharges);
    sortChronologically(allocated, TieBreak::Ingestion);

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 2: Прогон по истории
    // ═════════════════════════════════════════════════════════════════════════

    LotLedger ledger(options_.epsilon);
    CorporateActionAdjuster adjuster(
        options_.applyCorporateActions ? corporateActions : std::vector<CorporateAction>{});

    for (const auto& item : allocated) {
        const Trade& trade = item.trade;

        // Сплиты, вступившие в силу до этой сделки
        adjuster.applyPending(ledger, trade.date);

        if (trade.side == TradeSide::Buy) {
            ledger.addLot(trade.symbol, Lot{
                trade.quantity, trade.date, trade.price, item.netPrice, trade.tradeId});
            continue;
        }

        auto match = ledger.consume(trade.symbol, trade.quantity);

        double realizedPnl = 0.0;
        double buyCost = 0.0;
        for (const auto& slice : match.slices) {
            realizedPnl += (item.netPrice - slice.netUnitPrice) * slice.quantity;
            buyCost += slice.netUnitPrice * slice.quantity;
        }

        RealizedGainRecord record;
        record.tradeId = trade.tradeId;
        record.symbol = trade.symbol;
        record.sellDate = trade.date;
        record.sellQuantity = trade.quantity;
        record.sellPrice = item.netPrice;
        record.avgBuyPrice = match.matchedQuantity > 0.0 ? buyCost / match.matchedQuantity : 0.0;
        record.realizedPnl = realizedPnl;
        result.realizedGains.push_back(std::move(record));

        if (!match.fullyMatched(options_.epsilon)) {
            result.unmatchedSells.push_back(UnmatchedSell{
                trade.symbol, trade.date, trade.quantity, match.unmatchedQuantity});
        }
    }

    // Оставшиеся сплиты в пределах горизонта запроса
    if (upTo) {
        adjuster.applyPending(ledger, *upTo);
    } else {
        adjuster.applyAll(ledger);
    }

    result.holdings = ledger.snapshot();
    result.skippedActions = adjuster.skipped();
    return result;
}

Holdings FifoMatcher::holdingsAsOf(
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions,
    std::optional<Date> upTo) const
{
    return run(trades, dailyCharges, corporateActions, upTo).holdings;
}

std::vector<RealizedGainRecord> FifoMatcher::realizedGains(
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions) const
{
    return run(trades, dailyCharges, corporateActions).realizedGains;
}

std::vector<UnmatchedSell> FifoMatcher::unmatchedSells(
    const std::vector<Trade>& trades,
    const std::vector<CorporateAction>& corporateActions) const
{
    // Комиссии на количество не влияют
    return run(trades, {}, corporateActions).unmatchedSells;
}

}  // namespace taxlot
