#pragma once

#include "Types.hpp"
#include "Error.hpp"
#include "FifoMatcher.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taxlot {

// Позиции с меньшим количеством считаются закрытыми
inline constexpr double kActiveQuantityThreshold = 0.01;

// ═══════════════════════════════════════════════════════════════════════════════
// Структуры отчетов
// ═══════════════════════════════════════════════════════════════════════════════

struct HoldingSummary {
    std::string symbol;
    double quantity = 0.0;
    double avgPrice = 0.0;
    double cmp = 0.0;            // Текущая цена (или средняя, если цены нет)
    double currentValue = 0.0;
    double investedValue = 0.0;
    double pnl = 0.0;
    double pnlPct = 0.0;
};

struct RealizedReportRow {
    std::string tradeId;
    std::string symbol;
    Date sellDate;
    double sellQuantity = 0.0;
    double sellPrice = 0.0;      // 4 знака
    double avgBuyPrice = 0.0;    // 4 знака
    double realizedPnl = 0.0;    // 2 знака
};

struct RealizedReport {
    std::string fiscalYear;
    std::vector<RealizedReportRow> rows;
    double total = 0.0;
};

struct FiscalYearValue {
    std::string fiscalYear;
    double networth = 0.0;
};

struct FiscalYearCharges {
    std::string fiscalYear;
    double charges = 0.0;        // 2 знака
};

struct Dashboard {
    std::string fiscalYear;
    std::vector<std::string> fiscalYears;
    std::vector<HoldingSummary> holdings;
    std::vector<Date> healthIssues;              // Даты сделок без агрегата комиссий
    std::vector<UnmatchedSell> unmatchedSells;   // Только за выбранный FY
    std::vector<SkippedCorporateAction> skippedActions;
    double realizedPnl = 0.0;
    double netWorth = 0.0;
    double netWorthFyEnd = 0.0;
    double netWorthPrevFyEnd = 0.0;
    double netWorthYoy = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Оценка позиций
// ═══════════════════════════════════════════════════════════════════════════════

// Тикеры с количеством > 0.01
std::vector<std::string> activeSymbols(const Holdings& holdings);

// Сводка по открытым позициям. Значения округлены до 2 знаков
std::vector<HoldingSummary> summarizeHoldings(const Holdings& holdings, const PriceMap& livePrices);

// Σ qty * cmp, при отсутствии цены используется средняя цена лотов
double valueHoldings(const Holdings& holdings, const PriceMap& livePrices);

// Тикер для поиска цены с учетом псевдонимов
std::string resolveSymbol(const std::string& symbol, const SymbolAliasMap& aliases);

// ═══════════════════════════════════════════════════════════════════════════════
// Portfolio Report - представления поверх результатов FIFO
// ═══════════════════════════════════════════════════════════════════════════════

class PortfolioReport {
public:
    explicit PortfolioReport(LedgerSnapshot ledger, MatchOptions options = {});

    // Отсортированный список FY, в которых есть сделки
    std::vector<std::string> fiscalYears() const;

    std::vector<Date> healthIssues() const;

    Holdings holdings(std::optional<Date> asOf = std::nullopt) const;

    Expected<RealizedReport> realizedReport(std::string_view fiscalYear) const;

    Expected<std::vector<UnmatchedSell>> unmatchedSells(std::string_view fiscalYear) const;

    Expected<Dashboard> buildDashboard(std::string_view fiscalYear, const PriceMap& livePrices) const;

    // Стоимость портфеля на конец каждого FY по текущим ценам
    std::vector<FiscalYearValue> networthByFy(const PriceMap& livePrices) const;

    // Сумма дневных комиссий за каждый FY со сделками, 0.0 если комиссий нет
    std::vector<FiscalYearCharges> chargesByFy() const;

    const LedgerSnapshot& ledger() const noexcept { return ledger_; }

private:
    LedgerSnapshot ledger_;
    FifoMatcher matcher_;
};

}  // namespace taxlot
