#pragma once

#include "CommandLineParser.hpp"
#include "Error.hpp"
#include "FifoMatcher.hpp"
#include "LedgerCsvReader.hpp"
#include "PortfolioReport.hpp"
#include "PriceCache.hpp"
#include "TaxCalculatorRegistry.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace taxlot {

enum class OutputFormat {
    Text,
    Json
};

class CommandExecutor {
public:
    explicit CommandExecutor(std::shared_ptr<IFileReader> fileReader = nullptr);
    ~CommandExecutor() = default;

    Result execute(const ParsedCommand& cmd);

    // Парсер нужен справке для вывода опций команд
    void setCommandLineParser(std::shared_ptr<CommandLineParser> parser) noexcept {
        parser_ = parser;
    }

    const TaxCalculatorRegistry& registry() const noexcept { return registry_; }

private:
    LedgerCsvReader reader_;
    TaxCalculatorRegistry registry_;
    PriceCache priceCache_;
    std::shared_ptr<CommandLineParser> parser_;

    // Help & Version
    Result executeHelp(const ParsedCommand& cmd);
    Result executeVersion(const ParsedCommand& cmd);
    void printHelp(std::string_view topic = "");
    void printVersion() const;

    // Commands
    Result executeHoldings(const ParsedCommand& cmd);
    Result executeRealized(const ParsedCommand& cmd);
    Result executeUnmatched(const ParsedCommand& cmd);
    Result executeDashboard(const ParsedCommand& cmd);
    Result executeTax(const ParsedCommand& cmd);
    Result executeCountries(const ParsedCommand& cmd);

    // ═════════════════════════════════════════════════════════════════════════
    // Загрузка входных данных
    // ═════════════════════════════════════════════════════════════════════════

    Expected<LedgerSnapshot> loadLedger(const ParsedCommand& cmd);

    Expected<SymbolAliasMap> loadAliases(const ParsedCommand& cmd);

    // Текущие цены для тикеров через кеш. Без --prices - пустой результат
    Expected<PriceLookup> loadLivePrices(
        const ParsedCommand& cmd,
        const std::vector<std::string>& symbols,
        const SymbolAliasMap& aliases);

    static MatchOptions matchOptions(const ParsedCommand& cmd);

    static Expected<OutputFormat> outputFormat(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    Expected<T> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    template<typename T>
    T getOption(const ParsedCommand& cmd, std::string_view optionName, T fallback) const;

    // Текстовый вывод
    void printHoldings(const Holdings& holdings) const;
    void printRealizedReport(const RealizedReport& report) const;
    void printUnmatchedSells(const std::vector<UnmatchedSell>& sells) const;
    void printDashboard(
        const Dashboard& dashboard,
        const std::vector<FiscalYearValue>& networthByFy,
        const std::vector<FiscalYearCharges>& chargesByFy,
        const std::vector<MissingPrice>& missingPrices) const;
    void printTaxReport(const TaxReport& report) const;
};

// Template implementation
template<typename T>
Expected<T> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const
{
    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return makeError(ErrorCode::InvalidRequest,
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const boost::bad_any_cast& e) {
        return makeError(ErrorCode::InvalidRequest,
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

template<typename T>
T CommandExecutor::getOption(const ParsedCommand& cmd, std::string_view optionName, T fallback) const
{
    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return fallback;
    }
    return cmd.options.at(optName).as<T>();
}

}  // namespace taxlot
