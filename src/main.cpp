#include "CommandLineParser.hpp"
#include "CommandExecutor.hpp"
#include <iostream>
#include <memory>

using namespace taxlot;

int main(int argc, char** argv)
{
    try {
        auto parser = std::make_shared<CommandLineParser>();

        auto parseResult = parser->parse(argc, argv);

        if (!parseResult) {
            std::cerr << "Parse error: " << parseResult.error().message << std::endl;
            return 1;
        }

        const auto& cmd = parseResult.value();

        CommandExecutor executor;
        executor.setCommandLineParser(parser);

        auto execResult = executor.execute(cmd);

        if (!execResult) {
            std::cerr << "Error: " << execResult.error().message << std::endl;
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
