#include "FinlandTaxCalculator.hpp"
#include "CorporateActionAdjuster.hpp"
#include "DateUtils.hpp"
#include "FifoMatcher.hpp"
#include "LotLedger.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace taxlot {

namespace {

const char* kFormulaActual =
    "Actual method: Selling price - (Acquisition cost + transfer tax + deductible expenses)";
const char* kFormulaDeemed =
    "Deemed method: Selling price - (20% or 40% deemed acquisition cost)";

const char* kDisclaimer =
    "Estimate only. Use as a reporting aid and validate final values against official "
    "Vero instructions/forms for your filing year and edge cases.";

}  // namespace

FinlandTaxCalculator::FinlandTaxCalculator()
    : rules_()
{
}

FinlandTaxCalculator::FinlandTaxCalculator(FinlandTaxRules rules)
    : rules_(rules)
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// Правила
// ═══════════════════════════════════════════════════════════════════════════════

double FinlandTaxCalculator::deemedRateForLot(const Date& buyDate, const Date& sellDate) const noexcept
{
    return heldAtLeastYears(buyDate, sellDate, rules_.longHoldingYears)
        ? rules_.deemedRateLong
        : rules_.deemedRateShort;
}

double FinlandTaxCalculator::taxFromProgressiveRate(double taxableAmount) const noexcept
{
    if (taxableAmount <= 0.0) {
        return 0.0;
    }

    double lowerBand = std::min(rules_.lowerBandLimit, taxableAmount) * rules_.lowerBandRate;
    double upperBand = std::max(0.0, taxableAmount - rules_.lowerBandLimit) * rules_.upperBandRate;
    return lowerBand + upperBand;
}

std::vector<std::string> FinlandTaxCalculator::formulaLines()
{
    return {kFormulaActual, kFormulaDeemed};
}

// ═══════════════════════════════════════════════════════════════════════════════
// FIFO проход по всей истории
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<FinlandTaxCalculator::SaleComputation> FinlandTaxCalculator::calculateSales(
    const std::vector<AllocatedTrade>& allocated,
    const std::vector<CorporateAction>& corporateActions,
    MethodMode mode) const
{
    std::vector<SaleComputation> sales;

    LotLedger ledger(kTaxEpsilon);
    CorporateActionAdjuster adjuster(
        rules_.applyCorporateActions ? corporateActions : std::vector<CorporateAction>{});

    std::size_t sellIndex = 0;

    for (const auto& item : allocated) {
        const Trade& trade = item.trade;

        adjuster.applyPending(ledger, trade.date);

        if (trade.side == TradeSide::Buy) {
            ledger.addLot(trade.symbol, Lot{
                trade.quantity, trade.date, trade.price, item.netPrice, trade.tradeId});
            continue;
        }

        // Продажи других лет тоже списывают лоты
        const std::size_t index = sellIndex++;
        const double grossSell = trade.price;
        const double sellChargePerUnit = std::max(0.0, grossSell - item.netPrice);

        auto match = ledger.consume(trade.symbol, trade.quantity);
        if (match.matchedQuantity <= 0.0) {
            std::cerr << "⚠ Warning: sale of " << trade.symbol << " on "
                      << formatIsoDate(trade.date) << " has no matching purchases" << std::endl;
            continue;
        }
        if (!match.fullyMatched(kTaxEpsilon)) {
            std::cerr << "⚠ Warning: sale of " << trade.symbol << " on "
                      << formatIsoDate(trade.date) << " matched only " << match.matchedQuantity
                      << " of " << trade.quantity << std::endl;
        }

        SaleComputation sale;
        sale.saleId = !trade.tradeId.empty()
            ? trade.tradeId
            : trade.symbol + "-" + formatIsoDate(trade.date) + "-" + std::to_string(index);
        sale.symbol = trade.symbol;
        sale.sellDate = trade.date;

        for (const auto& slice : match.slices) {
            const double take = slice.quantity;
            const double lotProceeds = grossSell * take;
            const double buyCharge = std::max(0.0,
                (slice.netUnitPrice - slice.grossUnitPrice) * take);

            sale.proceeds += lotProceeds;
            sale.actualAcquisitionCost += slice.grossUnitPrice * take;
            sale.deductibleExpenses += buyCharge + sellChargePerUnit * take;
            sale.deemedCost += lotProceeds * deemedRateForLot(slice.acquisitionDate, trade.date);
            sale.weightedHoldingYears += holdingYears(slice.acquisitionDate, trade.date) * take;
            sale.matchedQuantity += take;
        }

        sale.actualGain = sale.proceeds - (sale.actualAcquisitionCost + sale.deductibleExpenses);
        sale.deemedGain = sale.proceeds - sale.deemedCost;

        switch (mode) {
            case MethodMode::Actual:
                sale.selectedMethod = MethodMode::Actual;
                sale.selectedGain = sale.actualGain;
                break;
            case MethodMode::Deemed:
                sale.selectedMethod = MethodMode::Deemed;
                sale.selectedGain = sale.deemedGain;
                break;
            case MethodMode::AutoBestPerSale:
                // Меньшая налоговая база по каждой продаже, при равенстве - actual
                if (sale.deemedGain < sale.actualGain) {
                    sale.selectedMethod = MethodMode::Deemed;
                    sale.selectedGain = sale.deemedGain;
                } else {
                    sale.selectedMethod = MethodMode::Actual;
                    sale.selectedGain = sale.actualGain;
                }
                break;
        }

        sales.push_back(std::move(sale));
    }

    return sales;
}

TaxReportRow FinlandTaxCalculator::toRow(const SaleComputation& sale)
{
    TaxReportRow row;
    row.saleId = sale.saleId;
    row.symbol = sale.symbol;
    row.sellDate = sale.sellDate;
    row.sellQuantity = roundTo(sale.matchedQuantity, 4);
    row.proceeds = roundTo(sale.proceeds, 2);
    row.actualAcquisitionCost = roundTo(sale.actualAcquisitionCost, 2);
    row.transferTax = 0.0;
    row.deductibleExpenses = roundTo(sale.deductibleExpenses, 2);
    row.actualTaxableGainLoss = roundTo(sale.actualGain, 2);
    row.deemedRateEffective = roundTo(sale.proceeds > 0.0 ? sale.deemedCost / sale.proceeds : 0.0, 4);
    row.deemedCost = roundTo(sale.deemedCost, 2);
    row.deemedTaxableGainLoss = roundTo(sale.deemedGain, 2);
    row.selectedMethod = sale.selectedMethod;
    row.selectedTaxableGainLoss = roundTo(sale.selectedGain, 2);
    row.avgHoldingYears = roundTo(sale.weightedHoldingYears / sale.matchedQuantity, 3);
    return row;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Отчет
// ═══════════════════════════════════════════════════════════════════════════════

TaxReport FinlandTaxCalculator::emptyReport(const TaxReportRequest& request, MethodMode mode) const
{
    const double priorLoss = roundTo(std::max(0.0, request.priorLossCarryforward), 2);

    TaxReport report;
    report.countryCode = std::string(countryCode());
    report.countryName = std::string(countryName());
    report.taxYear = request.taxYear;
    report.methodMode = mode;
    report.baseCurrency = request.baseCurrency;
    report.formulaText = "Capital gain/loss is calculated per sale, then aggregated for calendar year.";
    report.formulaLines = formulaLines();
    report.carryforward.priorLossCarryforward = priorLoss;
    report.carryforward.lossToCarryforwardNextYear = priorLoss;
    if (request.includeRows) {
        report.rows.emplace();
    }
    report.assumptions = {
        "Finland tax year is calendar year.",
        "No sales found for selected year.",
    };
    report.disclaimer = kDisclaimer;
    return report;
}

Expected<TaxReport> FinlandTaxCalculator::calculate(
    const TaxReportRequest& request,
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions) const
{
    auto mode = validateRequest(request);
    if (!mode) {
        return std::unexpected(mode.error());
    }

    std::vector<Trade> cleanTrades = trades;
    if (auto dropped = dropInvalidTrades(cleanTrades); dropped > 0) {
        std::cerr << "⚠ Warning: dropped " << dropped
                  << " trade(s) with non-positive quantity" << std::endl;
    }

    if (cleanTrades.empty()) {
        return emptyReport(request, *mode);
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 1: Комиссии и FIFO по всей истории
    // ═════════════════════════════════════════════════════════════════════════

    auto allocated = allocateCharges(cleanTrades, dailyCharges);
    sortChronologically(allocated, TieBreak::TradeId);

    auto allSales = calculateSales(allocated, corporateActions, *mode);

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 2: Агрегация за налоговый год
    // ═════════════════════════════════════════════════════════════════════════

    double totalProceeds = 0.0;
    double totalActual = 0.0;
    double totalDeemed = 0.0;
    double totalSelected = 0.0;
    MethodCounts counts;
    std::vector<TaxReportRow> rows;

    for (const auto& sale : allSales) {
        if (yearOf(sale.sellDate) != request.taxYear) {
            continue;
        }

        // Итоги складываются из округленных строк, чтобы отчет сходился с ними
        TaxReportRow row = toRow(sale);
        totalProceeds += row.proceeds;
        totalActual += row.actualTaxableGainLoss;
        totalDeemed += row.deemedTaxableGainLoss;
        totalSelected += row.selectedTaxableGainLoss;

        if (sale.selectedMethod == MethodMode::Deemed) {
            ++counts.deemed;
        } else {
            ++counts.actual;
        }

        rows.push_back(std::move(row));
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 3: Освобождение, перенос убытков, прогрессивная ставка
    // ═════════════════════════════════════════════════════════════════════════

    const bool exempt = totalProceeds <= rules_.smallSalesThreshold + kTaxEpsilon;
    const double priorLoss = std::max(0.0, request.priorLossCarryforward);

    double lossUsed = 0.0;
    double lossToCarry = priorLoss;
    double taxable = totalSelected;
    double estimatedTax = 0.0;
    bool lossNonDeductible = false;

    if (exempt) {
        // Убыток при освобожденных мелких продажах не вычитается и не переносится
        taxable = 0.0;
        lossNonDeductible = totalSelected < 0.0;
    } else {
        if (taxable > 0.0 && priorLoss > 0.0) {
            lossUsed = std::min(priorLoss, taxable);
            taxable -= lossUsed;
            lossToCarry = priorLoss - lossUsed;
        } else if (taxable <= 0.0) {
            lossToCarry = priorLoss + std::abs(taxable);
        }
        estimatedTax = taxFromProgressiveRate(taxable);
    }

    TaxReport report;
    report.countryCode = std::string(countryCode());
    report.countryName = std::string(countryName());
    report.taxYear = request.taxYear;
    report.methodMode = *mode;
    report.baseCurrency = request.baseCurrency;
    report.formulaText = std::string(kFormulaActual) + ". " + kFormulaDeemed + ".";
    report.formulaLines = formulaLines();
    report.methodCounts = counts;

    report.totals.proceeds = roundTo(totalProceeds, 2);
    report.totals.actualGainLoss = roundTo(totalActual, 2);
    report.totals.deemedGainLoss = roundTo(totalDeemed, 2);
    report.totals.selectedGainLossBeforeAdjustments = roundTo(totalSelected, 2);
    report.totals.selectedGainLossAfterAdjustments = roundTo(taxable, 2);
    report.totals.estimatedTax = roundTo(estimatedTax, 2);

    report.flags.smallSalesExemptionApplied = exempt;
    report.flags.lossNonDeductibleDueToSmallSalesRule = lossNonDeductible;

    report.carryforward.priorLossCarryforward = roundTo(priorLoss, 2);
    report.carryforward.lossUsedThisYear = roundTo(lossUsed, 2);
    report.carryforward.lossToCarryforwardNextYear = roundTo(std::max(0.0, lossToCarry), 2);

    if (request.includeRows) {
        report.rows = std::move(rows);
    }

    report.assumptions = {
        "Finland tax year is calendar year.",
        "FIFO lot matching is used.",
        "Daily charges from contract notes are allocated by turnover across trades on the same date.",
        "Transfer tax is set to 0 unless provided separately in source data.",
        "Auto mode compares methods on each sale row and picks the lower taxable gain/loss for that row.",
    };
    if (rules_.applyCorporateActions) {
        report.assumptions.push_back(
            "Lots acquired before a stock split are rescaled by the split ratio.");
    }
    report.disclaimer = kDisclaimer;

    return report;
}

}  // namespace taxlot
