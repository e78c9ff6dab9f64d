#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <string_view>

namespace taxlot {

// Календарная дата без времени суток
using Date = std::chrono::sys_days;

// ═══════════════════════════════════════════════════════════════════════════════
// Сделки
// ═══════════════════════════════════════════════════════════════════════════════

enum class TradeSide {
    Buy,
    Sell
};

// Разбор стороны сделки ("BUY", "b", "Sell"...). Нераспознанное значение -> nullopt
std::optional<TradeSide> parseTradeSide(std::string_view text) noexcept;
const char* toString(TradeSide side) noexcept;

struct Trade {
    std::string tradeId;
    std::string symbol;
    Date date;
    TradeSide side = TradeSide::Buy;
    double quantity = 0.0;
    double price = 0.0;

    double grossAmount() const noexcept { return quantity * price; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Дневные комиссии (агрегат одной или нескольких брокерских нот за дату)
// ═══════════════════════════════════════════════════════════════════════════════

struct DailyChargeAggregate {
    Date date;
    double totalBrokerage = 0.0;
    double totalTaxes = 0.0;
    double totalOtherCharges = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Корпоративные действия
// ═══════════════════════════════════════════════════════════════════════════════

enum class CorporateActionType {
    Split,
    Bonus,
    Merger,
    Other
};

CorporateActionType parseCorporateActionType(std::string_view text) noexcept;
const char* toString(CorporateActionType type) noexcept;

struct CorporateAction {
    std::string symbol;
    CorporateActionType actionType = CorporateActionType::Split;
    Date effectiveDate;
    double ratioFrom = 1.0;
    double ratioTo = 1.0;
    bool active = true;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Лоты и результаты сопоставления
// ═══════════════════════════════════════════════════════════════════════════════

struct Lot {
    double quantity = 0.0;
    Date acquisitionDate;
    double grossUnitPrice = 0.0;
    double netUnitPrice = 0.0;
    std::string tradeId;
};

// symbol -> открытые лоты в порядке FIFO
using Holdings = std::map<std::string, std::vector<Lot>>;

struct RealizedGainRecord {
    std::string tradeId;
    std::string symbol;
    Date sellDate;
    double sellQuantity = 0.0;
    double sellPrice = 0.0;
    double avgBuyPrice = 0.0;
    double realizedPnl = 0.0;
};

struct UnmatchedSell {
    std::string symbol;
    Date sellDate;
    double sellQuantity = 0.0;
    double unmatchedQuantity = 0.0;
};

struct SkippedCorporateAction {
    std::string symbol;
    CorporateActionType actionType = CorporateActionType::Split;
    Date effectiveDate;
    std::string reason;
};

// Живые цены и псевдонимы тикеров приходят извне готовыми
using PriceMap = std::map<std::string, double>;
using SymbolAliasMap = std::map<std::string, std::string>;

// ═══════════════════════════════════════════════════════════════════════════════
// Полный набор входных данных одного расчета
// ═══════════════════════════════════════════════════════════════════════════════

struct LedgerSnapshot {
    std::vector<Trade> trades;
    std::vector<DailyChargeAggregate> dailyCharges;
    std::vector<CorporateAction> corporateActions;
};

// Округление только на границе представления
double roundTo(double value, int digits) noexcept;

// Допуски для сравнения количеств
inline constexpr double kLedgerEpsilon = 1e-4;
inline constexpr double kTaxEpsilon = 1e-7;

}  // namespace taxlot
