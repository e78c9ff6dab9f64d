#include "LedgerCsvReader.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace taxlot {

namespace {

std::string trim(std::string_view text)
{
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

std::string toLower(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpper(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// Поле строки или пустая строка для короткой строки
const std::string& field(const std::vector<std::string>& row, std::size_t index)
{
    static const std::string empty;
    return index < row.size() ? row[index] : empty;
}

std::optional<bool> parseFlag(std::string_view text)
{
    std::string value = toLower(trim(text));
    if (value == "true" || value == "1" || value == "yes" || value == "y") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "n") {
        return false;
    }
    return std::nullopt;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<std::string>> FileReader::readLines(std::string_view filePath)
{
    std::vector<std::string> lines;
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return makeError(ErrorCode::IoError, "Failed to open file: " + std::string(filePath));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        return makeError(ErrorCode::IoError, "File is empty: " + std::string(filePath));
    }

    return lines;
}

std::optional<double> parseNumber(std::string_view text)
{
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        std::size_t idx = 0;
        double number = std::stod(value, &idx);
        if (idx == value.size()) {
            return number;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// LedgerCsvReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

LedgerCsvReader::LedgerCsvReader(std::shared_ptr<IFileReader> reader, char delimiter)
    : reader_(reader ? reader : std::make_shared<FileReader>()),
      delimiter_(delimiter)
{
}

std::vector<std::string> LedgerCsvReader::parseCsvLine(std::string_view line) const
{
    std::vector<std::string> fields;
    std::size_t start = 0;

    while (true) {
        auto pos = line.find(delimiter_, start);
        if (pos == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }

    return fields;
}

Expected<LedgerCsvReader::Table> LedgerCsvReader::readTable(std::string_view filePath) const
{
    auto linesResult = reader_->readLines(filePath);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = *linesResult;
    if (lines.empty()) {
        return makeError(ErrorCode::InvalidInput, "File has no header line: " + std::string(filePath));
    }

    Table table;
    auto header = parseCsvLine(lines.front());
    for (std::size_t i = 0; i < header.size(); ++i) {
        std::string name = toLower(header[i]);
        if (!name.empty() && !table.columns.count(name)) {
            table.columns.emplace(std::move(name), i);
        }
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        table.rows.push_back(parseCsvLine(lines[i]));
    }

    return table;
}

std::optional<std::size_t> LedgerCsvReader::findColumn(
    const Table& table,
    std::initializer_list<std::string_view> names)
{
    for (auto name : names) {
        auto it = table.columns.find(std::string(name));
        if (it != table.columns.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

Expected<std::size_t> LedgerCsvReader::requireColumn(
    const Table& table,
    std::string_view filePath,
    std::initializer_list<std::string_view> names)
{
    if (auto index = findColumn(table, names)) {
        return *index;
    }
    return makeError(ErrorCode::InvalidInput,
        std::string(filePath) + " is missing '" + std::string(*names.begin()) + "' column");
}

void LedgerCsvReader::reportDropped(std::string_view filePath, std::string_view what) const
{
    if (droppedRows_ > 0) {
        std::cerr << "⚠ Warning: " << filePath << ": dropped " << droppedRows_
                  << " " << what << " row(s) with invalid values" << std::endl;
    }
}

// ───────────────────────────────────────────────────────────────────────────────
// Сделки
// ───────────────────────────────────────────────────────────────────────────────

Expected<std::vector<Trade>> LedgerCsvReader::readTrades(std::string_view filePath)
{
    droppedRows_ = 0;

    auto table = readTable(filePath);
    if (!table) {
        return std::unexpected(table.error());
    }

    auto dateCol = requireColumn(*table, filePath, {"date", "trade_date"});
    if (!dateCol) return std::unexpected(dateCol.error());

    auto sideCol = requireColumn(*table, filePath, {"side", "type", "trade_type"});
    if (!sideCol) return std::unexpected(sideCol.error());

    auto qtyCol = requireColumn(*table, filePath, {"quantity"});
    if (!qtyCol) return std::unexpected(qtyCol.error());

    auto priceCol = requireColumn(*table, filePath, {"price"});
    if (!priceCol) return std::unexpected(priceCol.error());

    auto idCol = findColumn(*table, {"trade_id"});
    auto symbolCol = findColumn(*table, {"symbol"});

    std::vector<Trade> trades;
    for (const auto& row : table->rows) {
        auto date = parseIsoDate(field(row, *dateCol));
        auto side = parseTradeSide(field(row, *sideCol));
        auto quantity = parseNumber(field(row, *qtyCol));
        auto price = parseNumber(field(row, *priceCol));

        if (!date || !side || !quantity || !price
            || !(*quantity > 0.0) || !std::isfinite(*quantity) || !std::isfinite(*price)) {
            ++droppedRows_;
            continue;
        }

        Trade trade;
        trade.tradeId = idCol ? field(row, *idCol) : std::string();
        trade.symbol = symbolCol ? toUpper(field(row, *symbolCol)) : std::string();
        trade.date = *date;
        trade.side = *side;
        trade.quantity = *quantity;
        trade.price = *price;
        trades.push_back(std::move(trade));
    }

    reportDropped(filePath, "trade");
    return trades;
}

// ───────────────────────────────────────────────────────────────────────────────
// Дневные комиссии
// ───────────────────────────────────────────────────────────────────────────────

Expected<std::vector<DailyChargeAggregate>> LedgerCsvReader::readCharges(std::string_view filePath)
{
    droppedRows_ = 0;

    auto table = readTable(filePath);
    if (!table) {
        return std::unexpected(table.error());
    }

    auto dateCol = requireColumn(*table, filePath, {"date", "trade_date"});
    if (!dateCol) return std::unexpected(dateCol.error());

    auto brokerageCol = findColumn(*table, {"total_brokerage"});
    auto taxesCol = findColumn(*table, {"total_taxes"});
    auto otherCol = findColumn(*table, {"total_other_charges"});

    // Отсутствующее значение -> 0
    auto amount = [](const std::vector<std::string>& row, std::optional<std::size_t> col) {
        if (!col) {
            return 0.0;
        }
        return parseNumber(field(row, *col)).value_or(0.0);
    };

    std::vector<DailyChargeAggregate> charges;
    for (const auto& row : table->rows) {
        auto date = parseIsoDate(field(row, *dateCol));
        if (!date) {
            ++droppedRows_;
            continue;
        }

        charges.push_back(DailyChargeAggregate{
            *date,
            amount(row, brokerageCol),
            amount(row, taxesCol),
            amount(row, otherCol)});
    }

    reportDropped(filePath, "charge");
    return charges;
}

// ───────────────────────────────────────────────────────────────────────────────
// Корпоративные действия
// ───────────────────────────────────────────────────────────────────────────────

Expected<std::vector<CorporateAction>> LedgerCsvReader::readCorporateActions(std::string_view filePath)
{
    droppedRows_ = 0;

    auto table = readTable(filePath);
    if (!table) {
        return std::unexpected(table.error());
    }

    auto symbolCol = requireColumn(*table, filePath, {"symbol"});
    if (!symbolCol) return std::unexpected(symbolCol.error());

    auto typeCol = requireColumn(*table, filePath, {"action_type"});
    if (!typeCol) return std::unexpected(typeCol.error());

    auto dateCol = requireColumn(*table, filePath, {"effective_date"});
    if (!dateCol) return std::unexpected(dateCol.error());

    auto fromCol = requireColumn(*table, filePath, {"ratio_from"});
    if (!fromCol) return std::unexpected(fromCol.error());

    auto toCol = requireColumn(*table, filePath, {"ratio_to"});
    if (!toCol) return std::unexpected(toCol.error());

    auto activeCol = findColumn(*table, {"active"});

    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    std::vector<CorporateAction> actions;
    for (const auto& row : table->rows) {
        auto date = parseIsoDate(field(row, *dateCol));
        std::string symbol = toUpper(field(row, *symbolCol));
        if (!date || symbol.empty()) {
            ++droppedRows_;
            continue;
        }

        CorporateAction action;
        action.symbol = std::move(symbol);
        action.actionType = parseCorporateActionType(field(row, *typeCol));
        action.effectiveDate = *date;
        // Некорректный коэффициент сохраняется как NaN и отсеивается при применении
        action.ratioFrom = parseNumber(field(row, *fromCol)).value_or(kNaN);
        action.ratioTo = parseNumber(field(row, *toCol)).value_or(kNaN);
        action.active = activeCol ? parseFlag(field(row, *activeCol)).value_or(true) : true;
        actions.push_back(std::move(action));
    }

    reportDropped(filePath, "corporate action");
    return actions;
}

// ───────────────────────────────────────────────────────────────────────────────
// Цены и псевдонимы
// ───────────────────────────────────────────────────────────────────────────────

Expected<PriceMap> LedgerCsvReader::readPrices(std::string_view filePath)
{
    droppedRows_ = 0;

    auto table = readTable(filePath);
    if (!table) {
        return std::unexpected(table.error());
    }

    auto symbolCol = requireColumn(*table, filePath, {"symbol"});
    if (!symbolCol) return std::unexpected(symbolCol.error());

    auto priceCol = requireColumn(*table, filePath, {"price"});
    if (!priceCol) return std::unexpected(priceCol.error());

    PriceMap prices;
    for (const auto& row : table->rows) {
        std::string symbol = toUpper(field(row, *symbolCol));
        auto price = parseNumber(field(row, *priceCol));
        if (symbol.empty() || !price || !std::isfinite(*price)) {
            ++droppedRows_;
            continue;
        }
        prices[symbol] = *price;
    }

    reportDropped(filePath, "price");
    return prices;
}

Expected<SymbolAliasMap> LedgerCsvReader::readAliases(std::string_view filePath)
{
    droppedRows_ = 0;

    auto table = readTable(filePath);
    if (!table) {
        return std::unexpected(table.error());
    }

    auto fromCol = requireColumn(*table, filePath, {"from_symbol"});
    if (!fromCol) return std::unexpected(fromCol.error());

    auto toCol = requireColumn(*table, filePath, {"to_symbol"});
    if (!toCol) return std::unexpected(toCol.error());

    SymbolAliasMap aliases;
    for (const auto& row : table->rows) {
        std::string from = toUpper(field(row, *fromCol));
        std::string to = toUpper(field(row, *toCol));
        if (from.empty() || to.empty()) {
            ++droppedRows_;
            continue;
        }
        aliases[from] = to;
    }

    reportDropped(filePath, "alias");
    return aliases;
}

}  // namespace taxlot
