#include "ReportJson.hpp"
#include "DateUtils.hpp"

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// FIFO
// ═══════════════════════════════════════════════════════════════════════════════

json serializeHoldings(const Holdings& holdings)
{
    json j = json::object();
    for (const auto& [symbol, lots] : holdings) {
        json items = json::array();
        for (const auto& lot : lots) {
            json item;
            item["qty"] = lot.quantity;
            item["price"] = lot.netUnitPrice;
            item["gross_price"] = lot.grossUnitPrice;
            item["date"] = formatIsoDate(lot.acquisitionDate);
            items.push_back(std::move(item));
        }
        j[symbol] = std::move(items);
    }
    return j;
}

json serializeRealizedGains(const std::vector<RealizedGainRecord>& gains)
{
    json j = json::array();
    for (const auto& gain : gains) {
        json item;
        item["trade_id"] = gain.tradeId;
        item["symbol"] = gain.symbol;
        item["sell_date"] = formatIsoDate(gain.sellDate);
        item["sell_qty"] = gain.sellQuantity;
        item["sell_price"] = gain.sellPrice;
        item["avg_buy_price"] = gain.avgBuyPrice;
        item["realized_pnl"] = gain.realizedPnl;
        j.push_back(std::move(item));
    }
    return j;
}

json serializeUnmatchedSells(const std::vector<UnmatchedSell>& sells)
{
    json j = json::array();
    for (const auto& sell : sells) {
        json item;
        item["symbol"] = sell.symbol;
        item["sell_date"] = formatIsoDate(sell.sellDate);
        item["sell_qty"] = sell.sellQuantity;
        item["unmatched_qty"] = sell.unmatchedQuantity;
        j.push_back(std::move(item));
    }
    return j;
}

json serializeSkippedActions(const std::vector<SkippedCorporateAction>& actions)
{
    json j = json::array();
    for (const auto& action : actions) {
        json item;
        item["symbol"] = action.symbol;
        item["action_type"] = toString(action.actionType);
        item["effective_date"] = formatIsoDate(action.effectiveDate);
        item["reason"] = action.reason;
        j.push_back(std::move(item));
    }
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Портфель
// ═══════════════════════════════════════════════════════════════════════════════

json serializeHoldingSummaries(const std::vector<HoldingSummary>& holdings)
{
    json j = json::array();
    for (const auto& h : holdings) {
        json item;
        item["symbol"] = h.symbol;
        item["quantity"] = h.quantity;
        item["avg_price"] = h.avgPrice;
        item["cmp"] = h.cmp;
        item["current_val"] = h.currentValue;
        item["invested_val"] = h.investedValue;
        item["pnl"] = h.pnl;
        item["pnl_pct"] = h.pnlPct;
        j.push_back(std::move(item));
    }
    return j;
}

json serializeRealizedReport(const RealizedReport& report)
{
    json rows = json::array();
    for (const auto& row : report.rows) {
        json item;
        item["trade_id"] = row.tradeId;
        item["symbol"] = row.symbol;
        item["sell_date"] = formatIsoDate(row.sellDate);
        item["sell_qty"] = row.sellQuantity;
        item["sell_price"] = row.sellPrice;
        item["avg_buy_price"] = row.avgBuyPrice;
        item["realized_pnl"] = row.realizedPnl;
        rows.push_back(std::move(item));
    }

    json j;
    j["fy"] = report.fiscalYear;
    j["rows"] = std::move(rows);
    j["total"] = report.total;
    return j;
}

json serializeNetworthByFy(const std::vector<FiscalYearValue>& values)
{
    json j = json::array();
    for (const auto& value : values) {
        j.push_back({{"fy", value.fiscalYear}, {"networth", value.networth}});
    }
    return j;
}

json serializeChargesByFy(const std::vector<FiscalYearCharges>& values)
{
    json j = json::array();
    for (const auto& value : values) {
        j.push_back({{"fy", value.fiscalYear}, {"charges", value.charges}});
    }
    return j;
}

json serializeDashboard(const Dashboard& dashboard)
{
    json healthIssues = json::array();
    for (const auto& date : dashboard.healthIssues) {
        healthIssues.push_back(formatIsoDate(date));
    }

    json j;
    j["fy"] = dashboard.fiscalYear;
    j["fy_list"] = dashboard.fiscalYears;
    j["holdings"] = serializeHoldingSummaries(dashboard.holdings);
    j["health_issues"] = std::move(healthIssues);
    j["data_warnings"] = {
        {"unmatched_sells", serializeUnmatchedSells(dashboard.unmatchedSells)},
        {"skipped_corporate_actions", serializeSkippedActions(dashboard.skippedActions)}};
    j["realized_pnl"] = dashboard.realizedPnl;
    j["net_worth"] = dashboard.netWorth;
    j["net_worth_fy_end"] = dashboard.netWorthFyEnd;
    j["net_worth_prev_fy_end"] = dashboard.netWorthPrevFyEnd;
    j["net_worth_yoy"] = dashboard.netWorthYoy;
    return j;
}

json serializeMissingPrices(const std::vector<MissingPrice>& missing)
{
    json j = json::array();
    for (const auto& item : missing) {
        j.push_back({{"symbol", item.symbol}, {"attempted", item.attempted}});
    }
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Налоговый отчет
// ═══════════════════════════════════════════════════════════════════════════════

json serializeTaxReportRow(const TaxReportRow& row)
{
    json j;
    j["sale_id"] = row.saleId;
    j["symbol"] = row.symbol;
    j["sell_date"] = formatIsoDate(row.sellDate);
    j["sell_qty"] = row.sellQuantity;
    j["proceeds"] = row.proceeds;
    j["actual_acquisition_cost"] = row.actualAcquisitionCost;
    j["transfer_tax"] = row.transferTax;
    j["deductible_expenses"] = row.deductibleExpenses;
    j["actual_taxable_gain_loss"] = row.actualTaxableGainLoss;
    j["deemed_rate_effective"] = row.deemedRateEffective;
    j["deemed_cost"] = row.deemedCost;
    j["deemed_taxable_gain_loss"] = row.deemedTaxableGainLoss;
    j["selected_method"] = toString(row.selectedMethod);
    j["selected_taxable_gain_loss"] = row.selectedTaxableGainLoss;
    j["avg_holding_years"] = row.avgHoldingYears;
    return j;
}

json serializeTaxReport(const TaxReport& report)
{
    json j;
    j["country_code"] = report.countryCode;
    j["country_name"] = report.countryName;
    j["tax_year"] = report.taxYear;
    j["method_mode"] = toString(report.methodMode);
    j["base_currency"] = report.baseCurrency;
    j["formula_text"] = report.formulaText;
    j["formula_lines"] = report.formulaLines;

    if (report.methodCounts) {
        j["method_counts"] = {
            {"actual", report.methodCounts->actual},
            {"deemed", report.methodCounts->deemed}};
    }

    j["totals"] = {
        {"proceeds", report.totals.proceeds},
        {"actual_gain_loss", report.totals.actualGainLoss},
        {"deemed_gain_loss", report.totals.deemedGainLoss},
        {"selected_gain_loss_before_adjustments", report.totals.selectedGainLossBeforeAdjustments},
        {"selected_gain_loss_after_adjustments", report.totals.selectedGainLossAfterAdjustments},
        {"estimated_tax", report.totals.estimatedTax}};

    j["flags"] = {
        {"small_sales_exemption_applied", report.flags.smallSalesExemptionApplied},
        {"loss_non_deductible_due_to_small_sales_rule",
            report.flags.lossNonDeductibleDueToSmallSalesRule}};

    j["carryforward"] = {
        {"prior_loss_carryforward", report.carryforward.priorLossCarryforward},
        {"loss_used_this_year", report.carryforward.lossUsedThisYear},
        {"loss_to_carryforward_next_year", report.carryforward.lossToCarryforwardNextYear}};

    if (report.rows) {
        json rows = json::array();
        for (const auto& row : *report.rows) {
            rows.push_back(serializeTaxReportRow(row));
        }
        j["rows"] = std::move(rows);
    } else {
        j["rows"] = nullptr;
    }

    j["assumptions"] = report.assumptions;
    j["disclaimer"] = report.disclaimer;
    return j;
}

json serializeCountries(const std::vector<TaxCalculatorRegistry::AvailableCalculator>& countries)
{
    json j = json::array();
    for (const auto& country : countries) {
        j.push_back({{"country_code", country.countryCode}, {"country_name", country.countryName}});
    }
    return j;
}

json serializeError(const Error& error)
{
    return {{"error", toString(error.code)}, {"message", error.message}};
}

}  // namespace taxlot
