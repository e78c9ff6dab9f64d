#include "PortfolioReport.hpp"
#include "ChargeAllocator.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Оценка позиций
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<std::string> activeSymbols(const Holdings& holdings)
{
    std::vector<std::string> result;
    for (const auto& [symbol, lots] : holdings) {
        if (totalQuantity(lots) > kActiveQuantityThreshold) {
            result.push_back(symbol);
        }
    }
    return result;
}

std::vector<HoldingSummary> summarizeHoldings(const Holdings& holdings, const PriceMap& livePrices)
{
    std::vector<HoldingSummary> result;

    for (const auto& [symbol, lots] : holdings) {
        double qty = totalQuantity(lots);
        if (qty <= kActiveQuantityThreshold) {
            continue;
        }

        double avgPrice = std::abs(averageUnitPrice(lots));
        auto priceIt = livePrices.find(symbol);
        double cmp = priceIt != livePrices.end() ? priceIt->second : avgPrice;

        HoldingSummary summary;
        summary.symbol = symbol;
        summary.quantity = roundTo(qty, 2);
        summary.avgPrice = roundTo(avgPrice, 2);
        summary.cmp = roundTo(cmp, 2);
        summary.currentValue = roundTo(qty * cmp, 2);
        summary.investedValue = roundTo(qty * avgPrice, 2);
        summary.pnl = roundTo(qty * cmp - qty * avgPrice, 2);
        summary.pnlPct = avgPrice > 0.0 ? roundTo((cmp - avgPrice) / avgPrice * 100.0, 2) : 0.0;
        result.push_back(std::move(summary));
    }

    return result;
}

double valueHoldings(const Holdings& holdings, const PriceMap& livePrices)
{
    double total = 0.0;
    for (const auto& [symbol, lots] : holdings) {
        double qty = totalQuantity(lots);
        if (qty <= kActiveQuantityThreshold) {
            continue;
        }

        auto priceIt = livePrices.find(symbol);
        double cmp = priceIt != livePrices.end() ? priceIt->second : averageUnitPrice(lots);
        total += qty * cmp;
    }
    return total;
}

std::string resolveSymbol(const std::string& symbol, const SymbolAliasMap& aliases)
{
    auto it = aliases.find(symbol);
    return it != aliases.end() ? it->second : symbol;
}

// ═══════════════════════════════════════════════════════════════════════════════
// PortfolioReport
// ═══════════════════════════════════════════════════════════════════════════════

PortfolioReport::PortfolioReport(LedgerSnapshot ledger, MatchOptions options)
    : ledger_(std::move(ledger)),
      matcher_(options)
{
}

std::vector<std::string> PortfolioReport::fiscalYears() const
{
    std::set<std::string> labels;
    for (const auto& trade : ledger_.trades) {
        labels.insert(fiscalYearLabel(trade.date));
    }
    return {labels.begin(), labels.end()};
}

std::vector<Date> PortfolioReport::healthIssues() const
{
    std::set<Date> chargeDates;
    for (const auto& charges : ledger_.dailyCharges) {
        chargeDates.insert(charges.date);
    }

    std::set<Date> missing;
    for (const auto& trade : ledger_.trades) {
        if (!chargeDates.count(trade.date)) {
            missing.insert(trade.date);
        }
    }
    return {missing.begin(), missing.end()};
}

Holdings PortfolioReport::holdings(std::optional<Date> asOf) const
{
    return matcher_.holdingsAsOf(
        ledger_.trades, ledger_.dailyCharges, ledger_.corporateActions, asOf);
}

Expected<RealizedReport> PortfolioReport::realizedReport(std::string_view fiscalYear) const
{
    // Проверка формата метки
    auto fyEnd = fiscalYearEnd(fiscalYear);
    if (!fyEnd) {
        return std::unexpected(fyEnd.error());
    }

    RealizedReport report;
    report.fiscalYear = std::string(fiscalYear);

    auto gains = matcher_.realizedGains(
        ledger_.trades, ledger_.dailyCharges, ledger_.corporateActions);

    double total = 0.0;
    for (const auto& gain : gains) {
        if (fiscalYearLabel(gain.sellDate) != fiscalYear) {
            continue;
        }

        total += gain.realizedPnl;
        report.rows.push_back(RealizedReportRow{
            gain.tradeId,
            gain.symbol,
            gain.sellDate,
            gain.sellQuantity,
            roundTo(gain.sellPrice, 4),
            roundTo(gain.avgBuyPrice, 4),
            roundTo(gain.realizedPnl, 2)});
    }

    report.total = roundTo(total, 2);
    return report;
}

Expected<std::vector<UnmatchedSell>> PortfolioReport::unmatchedSells(std::string_view fiscalYear) const
{
    auto fyEnd = fiscalYearEnd(fiscalYear);
    if (!fyEnd) {
        return std::unexpected(fyEnd.error());
    }

    auto all = matcher_.unmatchedSells(ledger_.trades, ledger_.corporateActions);

    std::vector<UnmatchedSell> result;
    std::copy_if(all.begin(), all.end(), std::back_inserter(result),
        [fiscalYear](const UnmatchedSell& sell) {
            return fiscalYearLabel(sell.sellDate) == fiscalYear;
        });
    return result;
}

Expected<Dashboard> PortfolioReport::buildDashboard(
    std::string_view fiscalYear,
    const PriceMap& livePrices) const
{
    auto fyEnd = fiscalYearEnd(fiscalYear);
    if (!fyEnd) {
        return std::unexpected(fyEnd.error());
    }

    Dashboard dashboard;
    dashboard.fiscalYear = std::string(fiscalYear);

    if (ledger_.trades.empty()) {
        return dashboard;
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Текущие позиции и реализованный результат
    // ═════════════════════════════════════════════════════════════════════════

    auto current = matcher_.run(
        ledger_.trades, ledger_.dailyCharges, ledger_.corporateActions);

    dashboard.fiscalYears = fiscalYears();
    dashboard.healthIssues = healthIssues();
    dashboard.holdings = summarizeHoldings(current.holdings, livePrices);
    dashboard.skippedActions = current.skippedActions;

    double realized = 0.0;
    for (const auto& gain : current.realizedGains) {
        if (fiscalYearLabel(gain.sellDate) == fiscalYear) {
            realized += gain.realizedPnl;
        }
    }
    dashboard.realizedPnl = roundTo(realized, 2);

    auto unmatched = unmatchedSells(fiscalYear);
    if (!unmatched) {
        return std::unexpected(unmatched.error());
    }
    dashboard.unmatchedSells = std::move(*unmatched);

    // ═════════════════════════════════════════════════════════════════════════
    // Стоимость портфеля (по текущим ценам)
    // ═════════════════════════════════════════════════════════════════════════

    double netWorth = 0.0;
    for (const auto& holding : dashboard.holdings) {
        netWorth += holding.currentValue;
    }
    dashboard.netWorth = roundTo(netWorth, 2);

    const Date prevFyEnd = addYearsClamped(*fyEnd, -1);
    double valueFy = valueHoldings(holdings(*fyEnd), livePrices);
    double valuePrev = valueHoldings(holdings(prevFyEnd), livePrices);

    dashboard.netWorthFyEnd = roundTo(valueFy, 2);
    dashboard.netWorthPrevFyEnd = roundTo(valuePrev, 2);
    dashboard.netWorthYoy = roundTo(valueFy - valuePrev, 2);

    return dashboard;
}

std::vector<FiscalYearValue> PortfolioReport::networthByFy(const PriceMap& livePrices) const
{
    std::vector<FiscalYearValue> result;
    for (const auto& label : fiscalYears()) {
        // Метки построены fiscalYearLabel и всегда корректны
        auto fyEnd = fiscalYearEnd(label);
        if (!fyEnd) {
            continue;
        }
        result.push_back(FiscalYearValue{
            label, roundTo(valueHoldings(holdings(*fyEnd), livePrices), 2)});
    }
    return result;
}

std::vector<FiscalYearCharges> PortfolioReport::chargesByFy() const
{
    std::vector<FiscalYearCharges> result;
    for (const auto& label : fiscalYears()) {
        auto fyStart = fiscalYearStart(label);
        auto fyEnd = fiscalYearEnd(label);
        if (!fyStart || !fyEnd) {
            continue;
        }

        double total = 0.0;
        for (const auto& charges : ledger_.dailyCharges) {
            if (charges.date >= *fyStart && charges.date <= *fyEnd) {
                total += ChargeAllocator::dailyChargeTotal(charges);
            }
        }
        result.push_back(FiscalYearCharges{label, roundTo(total, 2)});
    }
    return result;
}

}  // namespace taxlot
