#include <gtest/gtest.h>
#include "CommandExecutor.hpp"
#include "CommandLineParser.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace taxlot;

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные классы
// ═══════════════════════════════════════════════════════════════════════════════

class MockFileReader : public IFileReader {
public:
    void setFile(const std::string& path, const std::vector<std::string>& lines) {
        files_[path] = lines;
    }

    Expected<std::vector<std::string>> readLines(std::string_view filePath) override {
        ++reads_;
        auto it = files_.find(std::string(filePath));
        if (it == files_.end()) {
            return makeError(ErrorCode::IoError, "Failed to open file: " + std::string(filePath));
        }
        return it->second;
    }

    int reads() const { return reads_; }

private:
    std::map<std::string, std::vector<std::string>> files_;
    int reads_ = 0;
};

// argv для CommandLineParser::parse
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: CommandLineParser
// ═══════════════════════════════════════════════════════════════════════════════

class CommandLineParserTest : public ::testing::Test {
protected:
    Expected<ParsedCommand> parse(std::initializer_list<std::string> args) {
        Args argv(args);
        return parser.parse(argv.argc(), argv.argv());
    }

    CommandLineParser parser;
};

TEST_F(CommandLineParserTest, NoCommand) {
    auto result = parse({"taxlot"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}

TEST_F(CommandLineParserTest, UnknownCommand) {
    auto result = parse({"taxlot", "rebalance"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "Unknown command: rebalance");
}

TEST_F(CommandLineParserTest, HelpForms) {
    auto global = parse({"taxlot", "help", "tax"});
    ASSERT_TRUE(global.has_value());
    EXPECT_EQ(global->command, "help");
    ASSERT_EQ(global->positional.size(), 1u);
    EXPECT_EQ(global->positional[0], "tax");

    auto inline_ = parse({"taxlot", "tax", "--help"});
    ASSERT_TRUE(inline_.has_value());
    EXPECT_EQ(inline_->command, "help");
    ASSERT_EQ(inline_->positional.size(), 1u);
    EXPECT_EQ(inline_->positional[0], "tax");
}

TEST_F(CommandLineParserTest, TaxOptionsAndDefaults) {
    auto result = parse({"taxlot", "tax", "-t", "trades.csv", "--year", "2024"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& options = result->options;
    EXPECT_EQ(result->command, "tax");
    EXPECT_EQ(options.at("trades").as<std::string>(), "trades.csv");
    EXPECT_EQ(options.at("year").as<int>(), 2024);
    EXPECT_EQ(options.at("country").as<std::string>(), "FI");
    EXPECT_EQ(options.at("method").as<std::string>(), "auto_best_per_sale");
    EXPECT_DOUBLE_EQ(options.at("prior-loss").as<double>(), 0.0);
    EXPECT_FALSE(options.at("no-rows").as<bool>());
    EXPECT_EQ(options.at("currency").as<std::string>(), "EUR");
    EXPECT_EQ(options.at("format").as<std::string>(), "text");
}

TEST_F(CommandLineParserTest, TaxOptionsExplicit) {
    auto result = parse({"taxlot", "tax", "-t", "t.csv", "-c", "c.csv", "-y", "2023",
                         "-m", "actual", "--prior-loss", "500", "--no-rows", "-f", "json"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& options = result->options;
    EXPECT_EQ(options.at("charges").as<std::string>(), "c.csv");
    EXPECT_EQ(options.at("method").as<std::string>(), "actual");
    EXPECT_DOUBLE_EQ(options.at("prior-loss").as<double>(), 500.0);
    EXPECT_TRUE(options.at("no-rows").as<bool>());
    EXPECT_EQ(options.at("format").as<std::string>(), "json");
}

TEST_F(CommandLineParserTest, MissingRequiredOption) {
    auto noTrades = parse({"taxlot", "tax", "--year", "2024"});
    ASSERT_FALSE(noTrades.has_value());
    EXPECT_EQ(noTrades.error().code, ErrorCode::InvalidRequest);

    auto noFy = parse({"taxlot", "realized", "-t", "trades.csv"});
    ASSERT_FALSE(noFy.has_value());

    // Для unmatched FY необязателен
    EXPECT_TRUE(parse({"taxlot", "unmatched", "-t", "trades.csv"}).has_value());
}

TEST_F(CommandLineParserTest, UnknownOptionRejected) {
    auto result = parse({"taxlot", "holdings", "-t", "trades.csv", "--bogus"});

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("Command line parsing error"), std::string::npos);
}

TEST_F(CommandLineParserTest, KnownCommands) {
    EXPECT_TRUE(CommandLineParser::isKnownCommand("tax"));
    EXPECT_TRUE(CommandLineParser::isKnownCommand("countries"));
    EXPECT_FALSE(CommandLineParser::isKnownCommand("portfolio"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: CommandExecutor
// ═══════════════════════════════════════════════════════════════════════════════

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader = std::make_shared<MockFileReader>();
        mockReader->setFile("trades.csv", {
            "trade_id,symbol,date,side,quantity,price",
            "T1,AAA,2024-01-10,BUY,10,100",
            "T2,AAA,2024-05-10,SELL,10,150",
            "T3,OLDCO,2024-02-01,BUY,4,25"
        });
        mockReader->setFile("charges.csv", {
            "date,total_brokerage,total_taxes,total_other_charges",
            "2024-01-10,0,0,0"
        });
        mockReader->setFile("prices.csv", {"symbol,price", "NEWCO,30"});
        mockReader->setFile("aliases.csv", {"from_symbol,to_symbol", "OLDCO,NEWCO"});

        executor = std::make_unique<CommandExecutor>(mockReader);
    }

    // Разбор и выполнение, stdout сохраняется в output
    Result run(std::initializer_list<std::string> args) {
        Args argv(args);
        auto parsed = parser.parse(argv.argc(), argv.argv());
        if (!parsed) {
            return std::unexpected(parsed.error());
        }

        testing::internal::CaptureStdout();
        auto result = executor->execute(*parsed);
        output = testing::internal::GetCapturedStdout();
        return result;
    }

    std::shared_ptr<MockFileReader> mockReader;
    std::unique_ptr<CommandExecutor> executor;
    CommandLineParser parser;
    std::string output;
};

TEST_F(CommandExecutorTest, ExecuteHelpCommand) {
    EXPECT_TRUE(run({"taxlot", "help"}));
    EXPECT_NE(output.find("COMMANDS:"), std::string::npos);

    EXPECT_TRUE(run({"taxlot", "help", "tax"}));
    EXPECT_NE(output.find("--prior-loss"), std::string::npos);
}

TEST_F(CommandExecutorTest, ExecuteVersionCommand) {
    EXPECT_TRUE(run({"taxlot", "version"}));
    EXPECT_NE(output.find("Version:"), std::string::npos);
}

TEST_F(CommandExecutorTest, UnknownCommandRejected) {
    ParsedCommand cmd;
    cmd.command = "portfolio";

    auto result = executor->execute(cmd);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}

TEST_F(CommandExecutorTest, HoldingsText) {
    auto result = run({"taxlot", "holdings", "-t", "trades.csv", "-c", "charges.csv"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("HOLDINGS"), std::string::npos);
    EXPECT_NE(output.find("OLDCO"), std::string::npos);
}

TEST_F(CommandExecutorTest, RealizedJson) {
    auto result = run({"taxlot", "realized", "-t", "trades.csv", "--fy", "FY2025", "-f", "json"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("\"fy\": \"FY2025\""), std::string::npos);
    EXPECT_NE(output.find("\"realized_pnl\": 500.0"), std::string::npos);
}

TEST_F(CommandExecutorTest, RealizedRejectsMalformedFiscalYear) {
    auto result = run({"taxlot", "realized", "-t", "trades.csv", "--fy", "2025"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST_F(CommandExecutorTest, DashboardUsesAliasedPrices) {
    auto result = run({"taxlot", "dashboard", "-t", "trades.csv", "-p", "prices.csv",
                       "--aliases", "aliases.csv", "--fy", "FY2024", "-f", "json"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("\"cmp\": 30.0"), std::string::npos);
    EXPECT_NE(output.find("\"missing_symbols\": []"), std::string::npos);
}

TEST_F(CommandExecutorTest, DashboardReportsChargesByFiscalYear) {
    mockReader->setFile("fees.csv", {
        "date,total_brokerage,total_taxes,total_other_charges",
        "2024-01-10,10,2.5,0",
        "2024-05-10,3,0,0.5"
    });

    auto result = run({"taxlot", "dashboard", "-t", "trades.csv", "-c", "fees.csv",
                       "--fy", "FY2025", "-f", "json"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("\"charges_by_fy\""), std::string::npos);
    EXPECT_NE(output.find("\"charges\": 12.5"), std::string::npos);
    EXPECT_NE(output.find("\"charges\": 3.5"), std::string::npos);

    result = run({"taxlot", "dashboard", "-t", "trades.csv", "-c", "fees.csv", "--fy", "FY2025"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("Charges by FY:"), std::string::npos);
}

TEST_F(CommandExecutorTest, TaxReportJson) {
    auto result = run({"taxlot", "tax", "-t", "trades.csv", "-c", "charges.csv",
                       "--year", "2024", "-f", "json"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("\"country_code\": \"FI\""), std::string::npos);
    EXPECT_NE(output.find("\"estimated_tax\": 150.0"), std::string::npos);
    EXPECT_NE(output.find("\"sale_id\": \"T2\""), std::string::npos);
}

TEST_F(CommandExecutorTest, TaxReportText) {
    auto result = run({"taxlot", "tax", "-t", "trades.csv", "--year", "2024", "--no-rows"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(output.find("CAPITAL GAINS TAX 2024"), std::string::npos);
    EXPECT_EQ(output.find("Sales:"), std::string::npos);
}

TEST_F(CommandExecutorTest, TaxUnsupportedCountryBeforeReadingFiles) {
    auto result = run({"taxlot", "tax", "-t", "trades.csv", "--year", "2024", "--country", "SE"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedCountry);
    EXPECT_EQ(mockReader->reads(), 0);
}

TEST_F(CommandExecutorTest, TaxInvalidMethod) {
    auto result = run({"taxlot", "tax", "-t", "trades.csv", "--year", "2024", "-m", "lifo"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}

TEST_F(CommandExecutorTest, MissingTradesFile) {
    auto result = run({"taxlot", "holdings", "-t", "missing.csv"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

TEST_F(CommandExecutorTest, UnknownOutputFormat) {
    auto result = run({"taxlot", "countries", "-f", "xml"});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}

TEST_F(CommandExecutorTest, CountriesJson) {
    auto result = run({"taxlot", "countries", "-f", "json"});

    ASSERT_TRUE(result.has_value());
    EXPECT_NE(output.find("\"country_code\": \"FI\""), std::string::npos);
    EXPECT_NE(output.find("\"country_name\": \"Finland\""), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
