#include "ChargeAllocator.hpp"
#include "DateUtils.hpp"
#include <cmath>
#include <iostream>

namespace taxlot {

ChargeAllocator::ChargeAllocator(const std::vector<DailyChargeAggregate>& dailyCharges)
{
    for (const auto& charges : dailyCharges) {
        auto [it, inserted] = chargesByDate_.emplace(charges.date, 0.0);
        if (!inserted) {
            std::cerr << "⚠ Warning: duplicate charge aggregate for "
                      << formatIsoDate(charges.date) << ", amounts merged" << std::endl;
        }
        it->second += dailyChargeTotal(charges);
    }
}

double ChargeAllocator::dailyChargeTotal(const DailyChargeAggregate& charges) noexcept
{
    return std::abs(charges.totalBrokerage)
         + std::abs(charges.totalTaxes)
         + std::abs(charges.totalOtherCharges);
}

std::vector<AllocatedTrade> ChargeAllocator::allocate(const std::vector<Trade>& trades) const
{
    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 1: Дневной оборот (суммирование в порядке входа)
    // ═════════════════════════════════════════════════════════════════════════

    std::map<Date, double> turnoverByDate;
    for (const auto& trade : trades) {
        turnoverByDate[trade.date] += trade.grossAmount();
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 2: Доля комиссии каждой сделки и net-цена
    // ═════════════════════════════════════════════════════════════════════════

    std::vector<AllocatedTrade> result;
    result.reserve(trades.size());

    for (const auto& trade : trades) {
        AllocatedTrade allocated;
        allocated.trade = trade;

        auto chargeIt = chargesByDate_.find(trade.date);
        const double turnover = turnoverByDate.at(trade.date);

        if (chargeIt != chargesByDate_.end() && turnover > 0.0) {
            allocated.allocatedCharge = (trade.grossAmount() / turnover) * chargeIt->second;
        }

        if (trade.quantity > 0.0) {
            double gross = trade.grossAmount();
            allocated.netPrice = trade.side == TradeSide::Buy
                ? (gross + allocated.allocatedCharge) / trade.quantity
                : (gross - allocated.allocatedCharge) / trade.quantity;
        } else {
            allocated.netPrice = trade.price;
        }

        result.push_back(std::move(allocated));
    }

    return result;
}

std::vector<AllocatedTrade> allocateCharges(
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges)
{
    return ChargeAllocator(dailyCharges).allocate(trades);
}

}  // namespace taxlot
