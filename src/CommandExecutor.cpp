#include "CommandExecutor.hpp"
#include "DateUtils.hpp"
#include "ReportJson.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace taxlot {

CommandExecutor::CommandExecutor(std::shared_ptr<IFileReader> fileReader)
    : reader_(std::move(fileReader)),
      registry_(TaxCalculatorRegistry::createDefault())
{
}

Result CommandExecutor::execute(const ParsedCommand& cmd)
{
    // Маршрутизация команд
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "holdings") {
        return executeHoldings(cmd);
    } else if (cmd.command == "realized") {
        return executeRealized(cmd);
    } else if (cmd.command == "unmatched") {
        return executeUnmatched(cmd);
    } else if (cmd.command == "dashboard") {
        return executeDashboard(cmd);
    } else if (cmd.command == "tax") {
        return executeTax(cmd);
    } else if (cmd.command == "countries") {
        return executeCountries(cmd);
    } else {
        return makeError(ErrorCode::InvalidRequest, "Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

Result CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    if (topic.empty() || !CommandLineParser::isKnownCommand(topic)
        || topic == "help" || topic == "version") {
        if (!topic.empty() && !CommandLineParser::isKnownCommand(topic)) {
            std::cout << "Unknown help topic: " << topic << std::endl;
        }

        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Tax Lot Ledger" << std::endl;
        std::cout << "Usage: taxlot <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  holdings                Open FIFO lots per symbol" << std::endl;
        std::cout << "  realized                Realized P&L for a fiscal year" << std::endl;
        std::cout << "  unmatched               Sells not covered by earlier buys" << std::endl;
        std::cout << "  dashboard               Holdings valuation and fiscal year summary" << std::endl;
        std::cout << "  tax                     Capital gains tax report for a country" << std::endl;
        std::cout << "  countries               List supported tax countries" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "Examples:" << std::endl;
        std::cout << "  taxlot holdings -t trades.csv -c charges.csv --as-of 2024-03-31" << std::endl;
        std::cout << "  taxlot realized -t trades.csv --fy FY2025" << std::endl;
        std::cout << "  taxlot tax -t trades.csv -c charges.csv --country FI --year 2024" << std::endl;
        std::cout << std::endl;

        std::cout << "For more information on a specific command, use:" << std::endl;
        std::cout << "  taxlot help <command>" << std::endl;
        std::cout << std::string(70, '=') << std::endl;
        std::cout << std::endl;
        return;
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "COMMAND: " << topic << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "USAGE:" << std::endl;
    std::cout << "  taxlot " << topic << " [OPTIONS]" << std::endl << std::endl;

    CommandLineParser fallbackParser;
    CommandLineParser& parser = parser_ ? *parser_ : fallbackParser;
    std::cout << parser.optionsFor(topic) << std::endl;

    if (topic == "tax") {
        std::cout << "EXAMPLES:" << std::endl;
        std::cout << "  # Finland, pick the lower of actual/deemed cost per sale" << std::endl;
        std::cout << "  taxlot tax -t trades.csv -c charges.csv --year 2024" << std::endl;
        std::cout << std::endl;
        std::cout << "  # Actual cost only, with loss carried forward" << std::endl;
        std::cout << "  taxlot tax -t trades.csv --year 2024 -m actual --prior-loss 500" << std::endl;
        std::cout << std::endl;
    }
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "Tax Lot Ledger" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Загрузка входных данных
// ═════════════════════════════════════════════════════════════════════════════

Expected<LedgerSnapshot> CommandExecutor::loadLedger(const ParsedCommand& cmd)
{
    auto tradesPath = getRequiredOption<std::string>(cmd, "trades");
    if (!tradesPath) {
        return std::unexpected(tradesPath.error());
    }

    LedgerSnapshot ledger;

    auto trades = reader_.readTrades(*tradesPath);
    if (!trades) {
        return std::unexpected(trades.error());
    }
    ledger.trades = std::move(*trades);

    if (cmd.options.count("charges")) {
        auto charges = reader_.readCharges(cmd.options.at("charges").as<std::string>());
        if (!charges) {
            return std::unexpected(charges.error());
        }
        ledger.dailyCharges = std::move(*charges);
    }

    if (cmd.options.count("actions")) {
        auto actions = reader_.readCorporateActions(cmd.options.at("actions").as<std::string>());
        if (!actions) {
            return std::unexpected(actions.error());
        }
        ledger.corporateActions = std::move(*actions);
    }

    std::cerr << "✓ Loaded " << ledger.trades.size() << " trades, "
              << ledger.dailyCharges.size() << " charge days, "
              << ledger.corporateActions.size() << " corporate actions" << std::endl;

    return ledger;
}

Expected<SymbolAliasMap> CommandExecutor::loadAliases(const ParsedCommand& cmd)
{
    if (!cmd.options.count("aliases")) {
        return SymbolAliasMap{};
    }
    return reader_.readAliases(cmd.options.at("aliases").as<std::string>());
}

Expected<PriceLookup> CommandExecutor::loadLivePrices(
    const ParsedCommand& cmd,
    const std::vector<std::string>& symbols,
    const SymbolAliasMap& aliases)
{
    if (!cmd.options.count("prices")) {
        return PriceLookup{};
    }

    const std::string pricesPath = cmd.options.at("prices").as<std::string>();

    return priceCache_.getOrLoad(symbols, aliases,
        [this, &pricesPath](const std::vector<std::string>& requested,
                            const std::map<std::string, std::string>& resolved)
            -> Expected<PriceLookup> {
            auto quotes = reader_.readPrices(pricesPath);
            if (!quotes) {
                return std::unexpected(quotes.error());
            }

            PriceLookup lookup;
            for (const auto& symbol : requested) {
                const std::string& ticker = resolved.at(symbol);
                auto it = quotes->find(ticker);
                if (it != quotes->end()) {
                    lookup.prices[symbol] = it->second;
                } else {
                    lookup.missingSymbols.push_back(MissingPrice{symbol, ticker});
                }
            }
            return lookup;
        });
}

MatchOptions CommandExecutor::matchOptions(const ParsedCommand& cmd)
{
    MatchOptions options;
    if (cmd.options.count("no-splits") && cmd.options.at("no-splits").as<bool>()) {
        options.applyCorporateActions = false;
    }
    return options;
}

Expected<OutputFormat> CommandExecutor::outputFormat(const ParsedCommand& cmd)
{
    if (!cmd.options.count("format")) {
        return OutputFormat::Text;
    }

    const auto& format = cmd.options.at("format").as<std::string>();
    if (format == "text") {
        return OutputFormat::Text;
    }
    if (format == "json") {
        return OutputFormat::Json;
    }
    return makeError(ErrorCode::InvalidRequest,
        "Unknown output format: " + format + " (expected text or json)");
}

// ═════════════════════════════════════════════════════════════════════════════
// Holdings
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeHoldings(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    std::optional<Date> asOf;
    if (cmd.options.count("as-of")) {
        auto date = parseIsoDate(cmd.options.at("as-of").as<std::string>());
        if (!date) {
            return std::unexpected(date.error());
        }
        asOf = *date;
    }

    auto ledger = loadLedger(cmd);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    FifoMatcher matcher(matchOptions(cmd));
    auto result = matcher.run(
        ledger->trades, ledger->dailyCharges, ledger->corporateActions, asOf);

    if (*format == OutputFormat::Json) {
        json j;
        j["as_of"] = asOf ? json(formatIsoDate(*asOf)) : json(nullptr);
        j["holdings"] = serializeHoldings(result.holdings);
        j["skipped_corporate_actions"] = serializeSkippedActions(result.skippedActions);
        std::cout << j.dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "HOLDINGS";
    if (asOf) {
        std::cout << " AS OF " << formatIsoDate(*asOf);
    }
    std::cout << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    printHoldings(result.holdings);
    std::cout << std::string(70, '=') << "\n" << std::endl;

    return {};
}

void CommandExecutor::printHoldings(const Holdings& holdings) const
{
    std::cout << std::fixed << std::setprecision(2);

    bool any = false;
    for (const auto& [symbol, lots] : holdings) {
        if (lots.empty()) {
            continue;
        }
        any = true;

        std::cout << "\n" << symbol << "  qty " << totalQuantity(lots)
                  << "  avg " << averageUnitPrice(lots) << std::endl;
        for (const auto& lot : lots) {
            std::cout << "  " << formatIsoDate(lot.acquisitionDate)
                      << "  " << std::setw(12) << lot.quantity
                      << " @ " << std::setw(10) << lot.netUnitPrice
                      << "  (gross " << lot.grossUnitPrice << ")" << std::endl;
        }
    }

    if (!any) {
        std::cout << "No open lots." << std::endl;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Realized & Unmatched
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeRealized(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto fy = getRequiredOption<std::string>(cmd, "fy");
    if (!fy) {
        return std::unexpected(fy.error());
    }

    auto ledger = loadLedger(cmd);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    PortfolioReport report(std::move(*ledger), matchOptions(cmd));
    auto realized = report.realizedReport(*fy);
    if (!realized) {
        return std::unexpected(realized.error());
    }

    if (*format == OutputFormat::Json) {
        std::cout << serializeRealizedReport(*realized).dump(2) << std::endl;
    } else {
        printRealizedReport(*realized);
    }
    return {};
}

void CommandExecutor::printRealizedReport(const RealizedReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "REALIZED P&L " << report.fiscalYear << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (report.rows.empty()) {
        std::cout << "No sales in " << report.fiscalYear << "." << std::endl;
    }

    for (const auto& row : report.rows) {
        std::cout << std::fixed << std::setprecision(4)
                  << formatIsoDate(row.sellDate) << "  " << std::left << std::setw(12) << row.symbol
                  << std::right << "  qty " << row.sellQuantity
                  << "  sell " << row.sellPrice
                  << "  avg buy " << row.avgBuyPrice
                  << std::setprecision(2) << "  pnl " << row.realizedPnl << std::endl;
    }

    std::cout << std::string(70, '-') << std::endl;
    std::cout << std::fixed << std::setprecision(2)
              << "Total realized: " << report.total << std::endl;
    std::cout << std::string(70, '=') << "\n" << std::endl;
}

Result CommandExecutor::executeUnmatched(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto ledger = loadLedger(cmd);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    std::vector<UnmatchedSell> sells;
    if (cmd.options.count("fy")) {
        PortfolioReport report(std::move(*ledger), matchOptions(cmd));
        auto filtered = report.unmatchedSells(cmd.options.at("fy").as<std::string>());
        if (!filtered) {
            return std::unexpected(filtered.error());
        }
        sells = std::move(*filtered);
    } else {
        FifoMatcher matcher(matchOptions(cmd));
        sells = matcher.unmatchedSells(ledger->trades, ledger->corporateActions);
    }

    if (*format == OutputFormat::Json) {
        std::cout << serializeUnmatchedSells(sells).dump(2) << std::endl;
    } else {
        printUnmatchedSells(sells);
    }
    return {};
}

void CommandExecutor::printUnmatchedSells(const std::vector<UnmatchedSell>& sells) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "UNMATCHED SELLS" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (sells.empty()) {
        std::cout << "✓ All sells are covered by earlier purchases" << std::endl;
    }

    for (const auto& sell : sells) {
        std::cout << std::fixed << std::setprecision(4)
                  << "⚠ " << formatIsoDate(sell.sellDate) << "  " << sell.symbol
                  << "  sold " << sell.sellQuantity
                  << "  unmatched " << sell.unmatchedQuantity << std::endl;
    }

    std::cout << std::string(70, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Dashboard
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeDashboard(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto fy = getRequiredOption<std::string>(cmd, "fy");
    if (!fy) {
        return std::unexpected(fy.error());
    }

    auto ledger = loadLedger(cmd);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    auto aliases = loadAliases(cmd);
    if (!aliases) {
        return std::unexpected(aliases.error());
    }

    PortfolioReport report(std::move(*ledger), matchOptions(cmd));

    auto symbols = activeSymbols(report.holdings());
    auto prices = loadLivePrices(cmd, symbols, *aliases);
    if (!prices) {
        return std::unexpected(prices.error());
    }

    auto dashboard = report.buildDashboard(*fy, prices->prices);
    if (!dashboard) {
        return std::unexpected(dashboard.error());
    }

    auto networth = report.networthByFy(prices->prices);
    auto charges = report.chargesByFy();

    if (*format == OutputFormat::Json) {
        json j = serializeDashboard(*dashboard);
        j["missing_symbols"] = serializeMissingPrices(prices->missingSymbols);
        j["symbol_aliases"] = *aliases;
        j["networth_by_fy"] = serializeNetworthByFy(networth);
        j["charges_by_fy"] = serializeChargesByFy(charges);
        std::cout << j.dump(2) << std::endl;
        return {};
    }

    printDashboard(*dashboard, networth, charges, prices->missingSymbols);
    return {};
}

void CommandExecutor::printDashboard(
    const Dashboard& dashboard,
    const std::vector<FiscalYearValue>& networthByFy,
    const std::vector<FiscalYearCharges>& chargesByFy,
    const std::vector<MissingPrice>& missingPrices) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DASHBOARD " << dashboard.fiscalYear << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::fixed << std::setprecision(2);

    std::cout << "\nHoldings:" << std::endl;
    if (dashboard.holdings.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto& h : dashboard.holdings) {
        std::cout << "  " << std::left << std::setw(12) << h.symbol << std::right
                  << " qty " << std::setw(10) << h.quantity
                  << "  avg " << std::setw(10) << h.avgPrice
                  << "  cmp " << std::setw(10) << h.cmp
                  << "  pnl " << std::setw(12) << h.pnl
                  << " (" << h.pnlPct << "%)" << std::endl;
    }

    std::cout << "\nSummary:" << std::endl;
    std::cout << "  Realized P&L:          " << dashboard.realizedPnl << std::endl;
    std::cout << "  Net worth:             " << dashboard.netWorth << std::endl;
    std::cout << "  Net worth at FY end:   " << dashboard.netWorthFyEnd << std::endl;
    std::cout << "  Previous FY end:       " << dashboard.netWorthPrevFyEnd << std::endl;
    std::cout << "  Year over year:        " << dashboard.netWorthYoy << std::endl;

    if (!networthByFy.empty()) {
        std::cout << "\nNet worth by FY:" << std::endl;
        for (const auto& value : networthByFy) {
            std::cout << "  " << value.fiscalYear << "  " << value.networth << std::endl;
        }
    }

    if (!chargesByFy.empty()) {
        std::cout << "\nCharges by FY:" << std::endl;
        for (const auto& value : chargesByFy) {
            std::cout << "  " << value.fiscalYear << "  " << value.charges << std::endl;
        }
    }

    if (!dashboard.healthIssues.empty()) {
        std::cout << "\n⚠ Trade dates without charges:" << std::endl;
        for (const auto& date : dashboard.healthIssues) {
            std::cout << "  " << formatIsoDate(date) << std::endl;
        }
    }

    for (const auto& sell : dashboard.unmatchedSells) {
        std::cout << "⚠ Unmatched sell: " << sell.symbol << " on " << formatIsoDate(sell.sellDate)
                  << " (" << sell.unmatchedQuantity << " of " << sell.sellQuantity << ")" << std::endl;
    }

    for (const auto& action : dashboard.skippedActions) {
        std::cout << "⚠ Skipped corporate action: " << action.symbol << " on "
                  << formatIsoDate(action.effectiveDate) << ": " << action.reason << std::endl;
    }

    for (const auto& missing : missingPrices) {
        std::cout << "⚠ No live price for " << missing.symbol
                  << " (tried " << missing.attempted << ")" << std::endl;
    }

    std::cout << std::string(70, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Tax
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeTax(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto year = getRequiredOption<int>(cmd, "year");
    if (!year) {
        return std::unexpected(year.error());
    }

    TaxReportRequest request;
    request.countryCode = getOption<std::string>(cmd, "country", "FI");
    request.taxYear = *year;
    request.methodMode = getOption<std::string>(cmd, "method", "auto_best_per_sale");
    request.priorLossCarryforward = getOption<double>(cmd, "prior-loss", 0.0);
    request.includeRows = !getOption<bool>(cmd, "no-rows", false);
    request.baseCurrency = getOption<std::string>(cmd, "currency", "EUR");

    // Страна проверяется до чтения файлов
    auto calculator = registry_.get(request.countryCode);
    if (!calculator) {
        return std::unexpected(calculator.error());
    }

    auto ledger = loadLedger(cmd);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    if (!matchOptions(cmd).applyCorporateActions) {
        ledger->corporateActions.clear();
    }

    auto report = calculateTaxReport(
        registry_, request, ledger->trades, ledger->dailyCharges, ledger->corporateActions);
    if (!report) {
        return std::unexpected(report.error());
    }

    if (*format == OutputFormat::Json) {
        std::cout << serializeTaxReport(*report).dump(2) << std::endl;
    } else {
        printTaxReport(*report);
    }
    return {};
}

void CommandExecutor::printTaxReport(const TaxReport& report) const
{
    const std::string& cur = report.baseCurrency;

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "CAPITAL GAINS TAX " << report.taxYear << " ("
              << report.countryName << ", " << toString(report.methodMode) << ")" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << std::fixed << std::setprecision(2);

    for (const auto& line : report.formulaLines) {
        std::cout << "  " << line << std::endl;
    }

    if (report.rows && !report.rows->empty()) {
        std::cout << "\nSales:" << std::endl;
        for (const auto& row : *report.rows) {
            std::cout << "  " << formatIsoDate(row.sellDate) << "  " << std::left << std::setw(10)
                      << row.symbol << std::right
                      << "  proceeds " << std::setw(12) << row.proceeds
                      << "  actual " << std::setw(10) << row.actualTaxableGainLoss
                      << "  deemed " << std::setw(10) << row.deemedTaxableGainLoss
                      << "  -> " << toString(row.selectedMethod)
                      << " " << row.selectedTaxableGainLoss << std::endl;
        }
    }

    std::cout << "\nTotals:" << std::endl;
    std::cout << "  Proceeds:              " << report.totals.proceeds << " " << cur << std::endl;
    std::cout << "  Actual gain/loss:      " << report.totals.actualGainLoss << " " << cur << std::endl;
    std::cout << "  Deemed gain/loss:      " << report.totals.deemedGainLoss << " " << cur << std::endl;
    std::cout << "  Selected (before):     " << report.totals.selectedGainLossBeforeAdjustments
              << " " << cur << std::endl;
    std::cout << "  Selected (after):      " << report.totals.selectedGainLossAfterAdjustments
              << " " << cur << std::endl;
    std::cout << "  Estimated tax:         " << report.totals.estimatedTax << " " << cur << std::endl;

    std::cout << "\nLoss carryforward:" << std::endl;
    std::cout << "  Prior:                 " << report.carryforward.priorLossCarryforward << std::endl;
    std::cout << "  Used this year:        " << report.carryforward.lossUsedThisYear << std::endl;
    std::cout << "  To next year:          " << report.carryforward.lossToCarryforwardNextYear << std::endl;

    if (report.flags.smallSalesExemptionApplied) {
        std::cout << "\n✓ Small sales exemption applied" << std::endl;
    }
    if (report.flags.lossNonDeductibleDueToSmallSalesRule) {
        std::cout << "⚠ Loss is not deductible under the small sales rule" << std::endl;
    }

    std::cout << "\nAssumptions:" << std::endl;
    for (const auto& assumption : report.assumptions) {
        std::cout << "  - " << assumption << std::endl;
    }

    std::cout << "\n" << report.disclaimer << std::endl;
    std::cout << std::string(70, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Countries
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeCountries(const ParsedCommand& cmd)
{
    auto format = outputFormat(cmd);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto countries = registry_.listAvailable();

    if (*format == OutputFormat::Json) {
        std::cout << serializeCountries(countries).dump(2) << std::endl;
        return {};
    }

    std::cout << "Supported countries (" << countries.size() << "):" << std::endl;
    for (const auto& country : countries) {
        std::cout << "  - " << country.countryCode << "  " << country.countryName << std::endl;
    }
    return {};
}

}  // namespace taxlot
