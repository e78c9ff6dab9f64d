#include <gtest/gtest.h>
#include "LedgerCsvReader.hpp"
#include "DateUtils.hpp"
#include <cmath>
#include <map>
#include <memory>
#include <vector>

using namespace taxlot;

// ═══════════════════════════════════════════════════════════════════════════════
// Mock File Reader для тестирования
// ═══════════════════════════════════════════════════════════════════════════════

class MockFileReader : public IFileReader {
public:
    void setFile(const std::string& path, const std::vector<std::string>& lines) {
        files_[path] = lines;
    }

    Expected<std::vector<std::string>> readLines(std::string_view filePath) override {
        auto it = files_.find(std::string(filePath));
        if (it == files_.end()) {
            return makeError(ErrorCode::IoError, "Failed to open file: " + std::string(filePath));
        }
        return it->second;
    }

private:
    std::map<std::string, std::vector<std::string>> files_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixture
// ═══════════════════════════════════════════════════════════════════════════════

class LedgerCsvReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader_ = std::make_shared<MockFileReader>();
        reader_ = std::make_unique<LedgerCsvReader>(mockReader_);
    }

    std::shared_ptr<MockFileReader> mockReader_;
    std::unique_ptr<LedgerCsvReader> reader_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сделки
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LedgerCsvReaderTest, ReadTrades) {
    mockReader_->setFile("trades.csv", {
        "trade_id,symbol,trade_date,trade_type,quantity,price",
        "T1,aaa,2024-01-10,buy,10,100.5",
        "T2,AAA,2024-02-01,SELL,4,120"
    });

    auto trades = reader_->readTrades("trades.csv");

    ASSERT_TRUE(trades.has_value()) << trades.error().message;
    ASSERT_EQ(trades->size(), 2u);

    const auto& first = (*trades)[0];
    EXPECT_EQ(first.tradeId, "T1");
    EXPECT_EQ(first.symbol, "AAA");
    EXPECT_EQ(first.date, makeDate(2024, 1, 10));
    EXPECT_EQ(first.side, TradeSide::Buy);
    EXPECT_DOUBLE_EQ(first.quantity, 10.0);
    EXPECT_DOUBLE_EQ(first.price, 100.5);

    EXPECT_EQ((*trades)[1].side, TradeSide::Sell);
    EXPECT_EQ(reader_->droppedRows(), 0u);
}

TEST_F(LedgerCsvReaderTest, HeaderIsCaseInsensitiveAndColumnsReordered) {
    mockReader_->setFile("trades.csv", {
        "Price, Quantity, Side, Date, Symbol",
        "50, 2, B, 2024-03-04, bbb"
    });

    auto trades = reader_->readTrades("trades.csv");

    ASSERT_TRUE(trades.has_value());
    ASSERT_EQ(trades->size(), 1u);
    EXPECT_EQ((*trades)[0].symbol, "BBB");
    EXPECT_TRUE((*trades)[0].tradeId.empty());
    EXPECT_DOUBLE_EQ((*trades)[0].price, 50.0);
}

TEST_F(LedgerCsvReaderTest, MissingRequiredColumnIsInvalidInput) {
    mockReader_->setFile("trades.csv", {
        "trade_id,symbol,date,side,price",
        "T1,AAA,2024-01-10,BUY,100"
    });

    auto trades = reader_->readTrades("trades.csv");

    ASSERT_FALSE(trades.has_value());
    EXPECT_EQ(trades.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(trades.error().message, "trades.csv is missing 'quantity' column");
}

TEST_F(LedgerCsvReaderTest, InvalidTradeRowsAreDropped) {
    mockReader_->setFile("trades.csv", {
        "symbol,date,side,quantity,price",
        "AAA,2024-01-10,BUY,10,100",
        "AAA,not-a-date,BUY,10,100",
        "AAA,2024-01-11,HOLD,10,100",
        "AAA,2024-01-12,BUY,abc,100",
        "AAA,2024-01-13,BUY,0,100",
        "AAA,2024-01-14,BUY,-1,100"
    });

    auto trades = reader_->readTrades("trades.csv");

    ASSERT_TRUE(trades.has_value());
    EXPECT_EQ(trades->size(), 1u);
    EXPECT_EQ(reader_->droppedRows(), 5u);
}

TEST_F(LedgerCsvReaderTest, MissingFileIsIoError) {
    auto trades = reader_->readTrades("nope.csv");

    ASSERT_FALSE(trades.has_value());
    EXPECT_EQ(trades.error().code, ErrorCode::IoError);
}

TEST_F(LedgerCsvReaderTest, HeaderOnlyFileHasNoRows) {
    mockReader_->setFile("trades.csv", {"symbol,date,side,quantity,price"});

    auto trades = reader_->readTrades("trades.csv");

    ASSERT_TRUE(trades.has_value());
    EXPECT_TRUE(trades->empty());
}

TEST_F(LedgerCsvReaderTest, CustomDelimiter) {
    LedgerCsvReader semicolon(mockReader_, ';');
    mockReader_->setFile("trades.csv", {
        "symbol;date;side;quantity;price",
        "AAA;2024-01-10;BUY;10;100"
    });

    auto trades = semicolon.readTrades("trades.csv");

    ASSERT_TRUE(trades.has_value());
    EXPECT_EQ(trades->size(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Комиссии и корпоративные действия
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LedgerCsvReaderTest, ReadChargesWithMissingAmounts) {
    mockReader_->setFile("charges.csv", {
        "date,total_brokerage,total_taxes",
        "2024-01-10,12.5,",
        "2024-01-11,3,1.5"
    });

    auto charges = reader_->readCharges("charges.csv");

    ASSERT_TRUE(charges.has_value());
    ASSERT_EQ(charges->size(), 2u);
    EXPECT_DOUBLE_EQ((*charges)[0].totalBrokerage, 12.5);
    EXPECT_DOUBLE_EQ((*charges)[0].totalTaxes, 0.0);
    EXPECT_DOUBLE_EQ((*charges)[0].totalOtherCharges, 0.0);
    EXPECT_DOUBLE_EQ((*charges)[1].totalTaxes, 1.5);
}

TEST_F(LedgerCsvReaderTest, ChargesRequireDateColumn) {
    mockReader_->setFile("charges.csv", {"total_brokerage", "5"});

    auto charges = reader_->readCharges("charges.csv");

    ASSERT_FALSE(charges.has_value());
    EXPECT_EQ(charges.error().code, ErrorCode::InvalidInput);
}

TEST_F(LedgerCsvReaderTest, ReadCorporateActions) {
    mockReader_->setFile("actions.csv", {
        "symbol,action_type,effective_date,ratio_from,ratio_to,active",
        "aaa,split,2024-03-01,1,2,",
        "BBB,BONUS,2024-04-01,1,1,true",
        "CCC,SPLIT,2024-05-01,x,2,0"
    });

    auto actions = reader_->readCorporateActions("actions.csv");

    ASSERT_TRUE(actions.has_value());
    ASSERT_EQ(actions->size(), 3u);

    const auto& split = (*actions)[0];
    EXPECT_EQ(split.symbol, "AAA");
    EXPECT_EQ(split.actionType, CorporateActionType::Split);
    EXPECT_EQ(split.effectiveDate, makeDate(2024, 3, 1));
    EXPECT_DOUBLE_EQ(split.ratioTo, 2.0);
    EXPECT_TRUE(split.active);

    EXPECT_EQ((*actions)[1].actionType, CorporateActionType::Bonus);

    // Некорректный коэффициент сохраняется, отсев при применении
    EXPECT_TRUE(std::isnan((*actions)[2].ratioFrom));
    EXPECT_FALSE((*actions)[2].active);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Цены и псевдонимы
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LedgerCsvReaderTest, ReadPricesAndAliases) {
    mockReader_->setFile("prices.csv", {"symbol,price", "aaa,130.25", "BBB,n/a"});
    mockReader_->setFile("aliases.csv", {"from_symbol,to_symbol", "oldco,newco"});

    auto prices = reader_->readPrices("prices.csv");
    ASSERT_TRUE(prices.has_value());
    ASSERT_EQ(prices->size(), 1u);
    EXPECT_DOUBLE_EQ(prices->at("AAA"), 130.25);
    EXPECT_EQ(reader_->droppedRows(), 1u);

    auto aliases = reader_->readAliases("aliases.csv");
    ASSERT_TRUE(aliases.has_value());
    EXPECT_EQ(aliases->at("OLDCO"), "NEWCO");
    EXPECT_EQ(reader_->droppedRows(), 0u);
}

TEST(ParseNumberTest, AcceptsOnlyWholeField) {
    EXPECT_DOUBLE_EQ(*parseNumber(" 12.5 "), 12.5);
    EXPECT_DOUBLE_EQ(*parseNumber("-3"), -3.0);
    EXPECT_FALSE(parseNumber("").has_value());
    EXPECT_FALSE(parseNumber("12abc").has_value());
    EXPECT_FALSE(parseNumber("abc").has_value());
    EXPECT_FALSE(parseNumber("1e999").has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
