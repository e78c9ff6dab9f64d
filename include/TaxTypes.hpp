#pragma once

#include "Types.hpp"
#include "Error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Метод расчета налогооблагаемой базы
// ═══════════════════════════════════════════════════════════════════════════════

enum class MethodMode {
    Actual,            // Фактическая стоимость приобретения
    Deemed,            // Нормативная стоимость (процент от выручки)
    AutoBestPerSale    // Меньшее из двух по каждой продаже
};

Expected<MethodMode> parseMethodMode(std::string_view text);
const char* toString(MethodMode mode) noexcept;

inline constexpr int kMinTaxYear = 1900;
inline constexpr int kMaxTaxYear = 2100;

// ═══════════════════════════════════════════════════════════════════════════════
// Запрос
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxReportRequest {
    std::string countryCode;
    int taxYear = 0;
    std::string methodMode = "auto_best_per_sale";
    double priorLossCarryforward = 0.0;
    bool includeRows = true;
    std::string baseCurrency = "EUR";  // Только для отображения
};

// Проверка запроса до начала расчета (InvalidRequest)
Expected<MethodMode> validateRequest(const TaxReportRequest& request);

// ═══════════════════════════════════════════════════════════════════════════════
// Отчет
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxReportRow {
    std::string saleId;
    std::string symbol;
    Date sellDate;
    double sellQuantity = 0.0;
    double proceeds = 0.0;
    double actualAcquisitionCost = 0.0;
    double transferTax = 0.0;
    double deductibleExpenses = 0.0;
    double actualTaxableGainLoss = 0.0;
    double deemedRateEffective = 0.0;
    double deemedCost = 0.0;
    double deemedTaxableGainLoss = 0.0;
    MethodMode selectedMethod = MethodMode::Actual;
    double selectedTaxableGainLoss = 0.0;
    double avgHoldingYears = 0.0;
};

struct TaxTotals {
    double proceeds = 0.0;
    double actualGainLoss = 0.0;
    double deemedGainLoss = 0.0;
    double selectedGainLossBeforeAdjustments = 0.0;
    double selectedGainLossAfterAdjustments = 0.0;
    double estimatedTax = 0.0;
};

struct TaxFlags {
    bool smallSalesExemptionApplied = false;
    bool lossNonDeductibleDueToSmallSalesRule = false;
};

struct CarryforwardSummary {
    double priorLossCarryforward = 0.0;
    double lossUsedThisYear = 0.0;
    double lossToCarryforwardNextYear = 0.0;
};

struct MethodCounts {
    std::int64_t actual = 0;
    std::int64_t deemed = 0;
};

struct TaxReport {
    std::string countryCode;
    std::string countryName;
    int taxYear = 0;
    MethodMode methodMode = MethodMode::AutoBestPerSale;
    std::string baseCurrency;

    std::string formulaText;
    std::vector<std::string> formulaLines;

    std::optional<MethodCounts> methodCounts;
    TaxTotals totals;
    TaxFlags flags;
    CarryforwardSummary carryforward;

    // nullopt если include_rows = false
    std::optional<std::vector<TaxReportRow>> rows;

    std::vector<std::string> assumptions;
    std::string disclaimer;
};

}  // namespace taxlot
