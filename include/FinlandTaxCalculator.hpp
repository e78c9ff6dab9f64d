#pragma once

#include "ITaxCalculator.hpp"
#include "ChargeAllocator.hpp"
#include <string>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Параметры налогообложения Финляндии
// ═══════════════════════════════════════════════════════════════════════════════

struct FinlandTaxRules {
    // Нормативная стоимость приобретения (доля выручки)
    double deemedRateShort = 0.20;
    double deemedRateLong = 0.40;
    int longHoldingYears = 10;

    // Освобождение мелких продаж: выручка за год <= порога
    double smallSalesThreshold = 1000.0;

    // Прогрессивная шкала
    double lowerBandLimit = 30000.0;
    double lowerBandRate = 0.30;
    double upperBandRate = 0.34;

    // Пересчет лотов на сплиты. По умолчанию корпоративные действия
    // не учитываются, расчет идет только по сделкам и комиссиям
    bool applyCorporateActions = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Налоговый калькулятор для Финляндии
// ═══════════════════════════════════════════════════════════════════════════════
//
// Оценка налога на прирост капитала. Результат требует сверки с официальными
// инструкциями Vero для соответствующего года.

class FinlandTaxCalculator : public ITaxCalculator {
public:
    FinlandTaxCalculator();
    explicit FinlandTaxCalculator(FinlandTaxRules rules);
    ~FinlandTaxCalculator() override = default;

    std::string_view countryCode() const noexcept override { return "FI"; }
    std::string_view countryName() const noexcept override { return "Finland"; }

    Expected<TaxReport> calculate(
        const TaxReportRequest& request,
        const std::vector<Trade>& trades,
        const std::vector<DailyChargeAggregate>& dailyCharges,
        const std::vector<CorporateAction>& corporateActions) const override;

    const FinlandTaxRules& rules() const noexcept { return rules_; }

    // ───────────────────────────────────────────────────────────────────────────
    // Правила (открыты для тестов)
    // ───────────────────────────────────────────────────────────────────────────

    // 40% при владении >= 10 лет (по годовщине), иначе 20%
    double deemedRateForLot(const Date& buyDate, const Date& sellDate) const noexcept;

    // min(30000, t) * 0.30 + max(0, t - 30000) * 0.34
    double taxFromProgressiveRate(double taxableAmount) const noexcept;

private:
    FinlandTaxRules rules_;

    // Расчет по одной продаже до округления
    struct SaleComputation {
        std::string saleId;
        std::string symbol;
        Date sellDate;
        double matchedQuantity = 0.0;
        double proceeds = 0.0;
        double actualAcquisitionCost = 0.0;
        double deductibleExpenses = 0.0;
        double deemedCost = 0.0;
        double actualGain = 0.0;
        double deemedGain = 0.0;
        MethodMode selectedMethod = MethodMode::Actual;
        double selectedGain = 0.0;
        double weightedHoldingYears = 0.0;
    };

    std::vector<SaleComputation> calculateSales(
        const std::vector<AllocatedTrade>& allocated,
        const std::vector<CorporateAction>& corporateActions,
        MethodMode mode) const;

    static TaxReportRow toRow(const SaleComputation& sale);

    TaxReport emptyReport(const TaxReportRequest& request, MethodMode mode) const;

    static std::vector<std::string> formulaLines();
};

}  // namespace taxlot
