#pragma once

#include "Types.hpp"
#include "TaxTypes.hpp"
#include "Error.hpp"
#include <string_view>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Tax Calculator Interface
// ═══════════════════════════════════════════════════════════════════════════════
//
// Одна реализация на страну. Расчет не хранит состояния между вызовами:
// каждая реализация сама распределяет комиссии и заново строит FIFO очереди.

class ITaxCalculator {
public:
    virtual ~ITaxCalculator() = default;

    virtual std::string_view countryCode() const noexcept = 0;
    virtual std::string_view countryName() const noexcept = 0;

    virtual Expected<TaxReport> calculate(
        const TaxReportRequest& request,
        const std::vector<Trade>& trades,
        const std::vector<DailyChargeAggregate>& dailyCharges,
        const std::vector<CorporateAction>& corporateActions) const = 0;

    // Disable copy
    ITaxCalculator(const ITaxCalculator&) = delete;
    ITaxCalculator& operator=(const ITaxCalculator&) = delete;

protected:
    ITaxCalculator() = default;
};

}  // namespace taxlot
