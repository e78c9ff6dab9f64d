#pragma once

#include "Types.hpp"
#include <map>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Сделка с распределенной комиссией
// ═══════════════════════════════════════════════════════════════════════════════

struct AllocatedTrade {
    Trade trade;
    double allocatedCharge = 0.0;
    // BUY:  (gross + charge) / qty - комиссия увеличивает стоимость покупки
    // SELL: (gross - charge) / qty - комиссия уменьшает выручку
    double netPrice = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Charge Allocator - распределение дневных комиссий по обороту сделок
// ═══════════════════════════════════════════════════════════════════════════════

class ChargeAllocator {
public:
    // Агрегаты с одинаковой датой суммируются
    explicit ChargeAllocator(const std::vector<DailyChargeAggregate>& dailyCharges);

    // Порядок результата совпадает с порядком входных сделок
    std::vector<AllocatedTrade> allocate(const std::vector<Trade>& trades) const;

    // |brokerage| + |taxes| + |other|
    static double dailyChargeTotal(const DailyChargeAggregate& charges) noexcept;

    bool hasChargesFor(const Date& date) const noexcept {
        return chargesByDate_.find(date) != chargesByDate_.end();
    }

    const std::map<Date, double>& chargesByDate() const noexcept {
        return chargesByDate_;
    }

private:
    std::map<Date, double> chargesByDate_;
};

// Удобная обертка: allocate(trades, dailyCharges)
std::vector<AllocatedTrade> allocateCharges(
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges);

}  // namespace taxlot
