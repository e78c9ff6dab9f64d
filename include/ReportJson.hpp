#pragma once

#include "Types.hpp"
#include "TaxTypes.hpp"
#include "PortfolioReport.hpp"
#include "PriceCache.hpp"
#include "TaxCalculatorRegistry.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace taxlot {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// JSON представление результатов
// ═══════════════════════════════════════════════════════════════════════════════

json serializeHoldings(const Holdings& holdings);
json serializeRealizedGains(const std::vector<RealizedGainRecord>& gains);
json serializeUnmatchedSells(const std::vector<UnmatchedSell>& sells);
json serializeSkippedActions(const std::vector<SkippedCorporateAction>& actions);

json serializeHoldingSummaries(const std::vector<HoldingSummary>& holdings);
json serializeRealizedReport(const RealizedReport& report);
json serializeNetworthByFy(const std::vector<FiscalYearValue>& values);
json serializeChargesByFy(const std::vector<FiscalYearCharges>& values);
json serializeDashboard(const Dashboard& dashboard);
json serializeMissingPrices(const std::vector<MissingPrice>& missing);

json serializeTaxReportRow(const TaxReportRow& row);
json serializeTaxReport(const TaxReport& report);

json serializeCountries(const std::vector<TaxCalculatorRegistry::AvailableCalculator>& countries);

json serializeError(const Error& error);

}  // namespace taxlot
