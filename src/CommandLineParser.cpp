#include "CommandLineParser.hpp"
#include <array>
#include <algorithm>
#include <sstream>

namespace taxlot {

namespace {

constexpr std::array<std::string_view, 8> kCommands = {
    "holdings", "realized", "unmatched", "dashboard", "tax", "countries", "help", "version"};

}  // namespace

bool CommandLineParser::isKnownCommand(std::string_view command) noexcept
{
    return std::find(kCommands.begin(), kCommands.end(), command) != kCommands.end();
}

Expected<ParsedCommand> CommandLineParser::parse(int argc, char* argv[])
{
    if (argc < 2) {
        return makeError(ErrorCode::InvalidRequest,
            "No command specified. Use 'taxlot help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help: "taxlot help tax", "taxlot tax --help"
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        if (argv[j][0] != '-') {
                            result.positional.push_back(argv[j]);
                        }
                    }
                } else {
                    result.positional.push_back(result.command);
                    result.command = "help";
                }
                return result;
            }
        }

        if (result.command == "version") {
            for (int i = 2; i < argc; ++i) {
                result.positional.push_back(argv[i]);
            }
            return result;
        }

        if (!isKnownCommand(result.command)) {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return makeError(ErrorCode::InvalidRequest, oss.str());
        }

        // Парсим опции
        auto desc = optionsFor(result.command);
        std::vector<std::string> args(argv + 2, argv + argc);
        po::store(po::command_line_parser(args).options(desc).run(), result.options);
        po::notify(result.options);

        return result;

    } catch (const po::error& e) {
        return makeError(ErrorCode::InvalidRequest,
            std::string("Command line parsing error: ") + e.what());
    }
}

po::options_description CommandLineParser::optionsFor(std::string_view command)
{
    po::options_description desc;

    if (command == "holdings") {
        desc.add(createInputOptions()).add(createHoldingsOptions()).add(createOutputOptions());
    } else if (command == "realized" || command == "dashboard") {
        desc.add(createInputOptions()).add(createFiscalYearOptions(true)).add(createOutputOptions());
    } else if (command == "unmatched") {
        desc.add(createInputOptions()).add(createFiscalYearOptions(false)).add(createOutputOptions());
    } else if (command == "tax") {
        desc.add(createInputOptions()).add(createTaxOptions()).add(createOutputOptions());
    } else if (command == "countries") {
        desc.add(createOutputOptions());
    }

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Input Options - файлы с данными
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createInputOptions()
{
    po::options_description desc("Input options");
    desc.add_options()
        ("trades,t", po::value<std::string>()->required(),
         "Trades CSV (trade_id,symbol,date,side,quantity,price)")

        ("charges,c", po::value<std::string>(),
         "Daily charges CSV (date,total_brokerage,total_taxes,total_other_charges)")

        ("actions,a", po::value<std::string>(),
         "Corporate actions CSV (symbol,action_type,effective_date,ratio_from,ratio_to,active)")

        ("prices,p", po::value<std::string>(),
         "Live prices CSV (symbol,price)")

        ("aliases", po::value<std::string>(),
         "Symbol aliases CSV (from_symbol,to_symbol)")

        ("no-splits", po::bool_switch()->default_value(false),
         "Do not rescale lots for stock splits");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Command Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createHoldingsOptions()
{
    po::options_description desc("Holdings options");
    desc.add_options()
        ("as-of", po::value<std::string>(),
         "Holdings as of date (YYYY-MM-DD, inclusive)");
    return desc;
}

po::options_description CommandLineParser::createFiscalYearOptions(bool fyRequired)
{
    po::options_description desc("Fiscal year options");
    if (fyRequired) {
        desc.add_options()
            ("fy", po::value<std::string>()->required(),
             "Fiscal year label (April-March), e.g. FY2025");
    } else {
        desc.add_options()
            ("fy", po::value<std::string>(),
             "Fiscal year label (April-March), e.g. FY2025");
    }
    return desc;
}

po::options_description CommandLineParser::createTaxOptions()
{
    po::options_description desc("Tax options");
    desc.add_options()
        ("country", po::value<std::string>()->default_value("FI"),
         "Country code")

        ("year,y", po::value<int>()->required(),
         "Tax year (1900-2100)")

        ("method,m", po::value<std::string>()->default_value("auto_best_per_sale"),
         "Cost method: actual, deemed, auto_best_per_sale")

        ("prior-loss", po::value<double>()->default_value(0.0),
         "Loss carried forward from previous years")

        ("no-rows", po::bool_switch()->default_value(false),
         "Omit per-sale rows from the report")

        ("currency", po::value<std::string>()->default_value("EUR"),
         "Base currency label");

    return desc;
}

po::options_description CommandLineParser::createOutputOptions()
{
    po::options_description desc("Output options");
    desc.add_options()
        ("format,f", po::value<std::string>()->default_value("text"),
         "Output format: text or json");
    return desc;
}

}  // namespace taxlot
