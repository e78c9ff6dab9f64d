#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <string_view>
#include <vector>
#include "Error.hpp"

namespace po = boost::program_options;

namespace taxlot {

struct ParsedCommand {
    std::string command;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    Expected<ParsedCommand> parse(int argc, char* argv[]);

    // Описания опций по командам (используются и в справке)
    po::options_description createInputOptions();
    po::options_description createHoldingsOptions();
    po::options_description createFiscalYearOptions(bool fyRequired);
    po::options_description createTaxOptions();
    po::options_description createOutputOptions();

    // Полное описание опций команды. Пустое описание - команда без опций
    po::options_description optionsFor(std::string_view command);

    static bool isKnownCommand(std::string_view command) noexcept;
};

}  // namespace taxlot
