#pragma once

#include "Types.hpp"
#include "ChargeAllocator.hpp"
#include <optional>
#include <vector>

namespace taxlot {

// Порядок сделок внутри одной даты
enum class TieBreak {
    Ingestion,  // Порядок поступления (стабильная сортировка по дате)
    TradeId     // По trade_id
};

// Отбросить сделки с неположительным количеством, вернуть число отброшенных
std::size_t dropInvalidTrades(std::vector<Trade>& trades);

// Сортировка по дате с заданным правилом для одинаковых дат
void sortChronologically(std::vector<AllocatedTrade>& trades, TieBreak tieBreak);

// ═══════════════════════════════════════════════════════════════════════════════
// Результат прогона FIFO
// ═══════════════════════════════════════════════════════════════════════════════

struct MatchResult {
    Holdings holdings;
    std::vector<RealizedGainRecord> realizedGains;
    std::vector<UnmatchedSell> unmatchedSells;
    std::vector<SkippedCorporateAction> skippedActions;
    std::size_t droppedTrades = 0;
};

struct MatchOptions {
    // Пересчитывать лоты на сплиты
    bool applyCorporateActions = true;
    double epsilon = kLedgerEpsilon;
};

// ═══════════════════════════════════════════════════════════════════════════════
// FIFO Matcher
// ═══════════════════════════════════════════════════════════════════════════════
//
// Каждый вызов строит собственный LotLedger с нуля по полной истории сделок.
// Общего изменяемого состояния между вызовами нет.

class FifoMatcher {
public:
    explicit FifoMatcher(MatchOptions options = {});

    // Полный прогон. upTo - включительно, nullopt - вся история
    MatchResult run(
        const std::vector<Trade>& trades,
        const std::vector<DailyChargeAggregate>& dailyCharges,
        const std::vector<CorporateAction>& corporateActions,
        std::optional<Date> upTo = std::nullopt) const;

    Holdings holdingsAsOf(
        const std::vector<Trade>& trades,
        const std::vector<DailyChargeAggregate>& dailyCharges,
        const std::vector<CorporateAction>& corporateActions,
        std::optional<Date> upTo = std::nullopt) const;

    std::vector<RealizedGainRecord> realizedGains(
        const std::vector<Trade>& trades,
        const std::vector<DailyChargeAggregate>& dailyCharges,
        const std::vector<CorporateAction>& corporateActions) const;

    std::vector<UnmatchedSell> unmatchedSells(
        const std::vector<Trade>& trades,
        const std::vector<CorporateAction>& corporateActions) const;

    const MatchOptions& options() const noexcept { return options_; }

private:
    MatchOptions options_;
};

// Средняя цена по лотам: sum(qty * net_price) / sum(qty). 0 при пустой позиции
double averageUnitPrice(const std::vector<Lot>& lots) noexcept;

double totalQuantity(const std::vector<Lot>& lots) noexcept;

}  // namespace taxlot
