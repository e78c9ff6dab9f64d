#pragma once

#include "Types.hpp"
#include "Error.hpp"
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение файлов
// ═══════════════════════════════════════════════════════════════════════════════

// Абстрактный интерфейс для чтения файлов
class IFileReader {
public:
    virtual ~IFileReader() = default;
    virtual Expected<std::vector<std::string>> readLines(std::string_view filePath) = 0;
};

// Реальная реализация для чтения файлов
class FileReader : public IFileReader {
public:
    Expected<std::vector<std::string>> readLines(std::string_view filePath) override;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Ledger CSV Reader - нормализованные CSV файлы с заголовком
// ═══════════════════════════════════════════════════════════════════════════════
//
// Колонки ищутся по имени в заголовке (регистр не важен).
// Нет обязательной колонки -> InvalidInput до начала расчетов.
// Строки с некорректными значениями отбрасываются с предупреждением.

class LedgerCsvReader {
public:
    explicit LedgerCsvReader(
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',');

    // trade_id, symbol, date|trade_date, side|type|trade_type, quantity, price
    Expected<std::vector<Trade>> readTrades(std::string_view filePath);

    // date, total_brokerage, total_taxes, total_other_charges
    Expected<std::vector<DailyChargeAggregate>> readCharges(std::string_view filePath);

    // symbol, action_type, effective_date, ratio_from, ratio_to, active
    Expected<std::vector<CorporateAction>> readCorporateActions(std::string_view filePath);

    // symbol, price
    Expected<PriceMap> readPrices(std::string_view filePath);

    // from_symbol, to_symbol
    Expected<SymbolAliasMap> readAliases(std::string_view filePath);

    // Число строк, отброшенных последним вызовом
    std::size_t droppedRows() const noexcept { return droppedRows_; }

private:
    std::shared_ptr<IFileReader> reader_;
    char delimiter_;
    std::size_t droppedRows_ = 0;

    struct Table {
        std::map<std::string, std::size_t> columns;  // имя (lower case) -> индекс
        std::vector<std::vector<std::string>> rows;
    };

    Expected<Table> readTable(std::string_view filePath) const;

    std::vector<std::string> parseCsvLine(std::string_view line) const;

    static std::optional<std::size_t> findColumn(
        const Table& table,
        std::initializer_list<std::string_view> names);

    static Expected<std::size_t> requireColumn(
        const Table& table,
        std::string_view filePath,
        std::initializer_list<std::string_view> names);

    void reportDropped(std::string_view filePath, std::string_view what) const;
};

// Число из поля CSV. Пустое или нечисловое значение -> nullopt
std::optional<double> parseNumber(std::string_view text);

}  // namespace taxlot
