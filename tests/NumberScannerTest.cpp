#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

import rai.jsonstream.byte_cursor;
import rai.jsonstream.decode_error;
import rai.jsonstream.json_token;
import rai.jsonstream.number_scanner;
import rai.jsonstream.test_helper;

using namespace rai::jsonstream;
using namespace rai::jsonstream::test;
using namespace rai::jsonstream::json_token_detail;

namespace {

/// @brief 入力の先頭から数値を読み取る。
JsonTokenValue scanText(const std::string& text) {
    ChunkedByteSource source(text, 3);
    ByteCursor<ChunkedByteSource> cursor(source);
    NumberScanner<ChunkedByteSource> scanner(cursor);
    return scanner.scan();
}

}  // namespace

// ********************************************************************************
// テストカテゴリ：整数
// ********************************************************************************

TEST(NumberScannerTest, Integers) {
    EXPECT_EQ(scanText("0"), JsonTokenValue{IntVal{0}});
    EXPECT_EQ(scanText("11"), JsonTokenValue{IntVal{11}});
    EXPECT_EQ(scanText("-394"), JsonTokenValue{IntVal{-394}});
    EXPECT_EQ(scanText("9223372036854775807"),
              JsonTokenValue{IntVal{std::numeric_limits<std::int64_t>::max()}});
    EXPECT_EQ(scanText("-9223372036854775808"),
              JsonTokenValue{IntVal{std::numeric_limits<std::int64_t>::min()}});
}

TEST(NumberScannerTest, IntegerOverflowThrows) {
    EXPECT_THROW(scanText("9223372036854775808"), DecodeError);
    EXPECT_THROW(scanText("-9223372036854775809"), DecodeError);
}

TEST(NumberScannerTest, MalformedIntegersThrow) {
    EXPECT_THROW(scanText("-"), DecodeError);
    EXPECT_THROW(scanText("1-2"), DecodeError);
    EXPECT_THROW(scanText("--1"), DecodeError);
}

// ********************************************************************************
// テストカテゴリ：浮動小数点数
// ********************************************************************************

TEST(NumberScannerTest, Floats) {
    EXPECT_EQ(scanText("2.2"), JsonTokenValue{NumVal{2.2}});
    EXPECT_EQ(scanText("1e-3"), JsonTokenValue{NumVal{0.001}});
    EXPECT_EQ(scanText("-0.5"), JsonTokenValue{NumVal{-0.5}});
    EXPECT_EQ(scanText("6.02E23"), JsonTokenValue{NumVal{6.02e23}});
    EXPECT_EQ(scanText(".5"), JsonTokenValue{NumVal{0.5}});
}

/// @brief '.'や'e'があれば、値が整数でも浮動小数点数になること。
TEST(NumberScannerTest, MarkerDecidesFloat) {
    EXPECT_EQ(scanText("1.0"), JsonTokenValue{NumVal{1.0}});
    EXPECT_EQ(scanText("1e2"), JsonTokenValue{NumVal{100.0}});
}

/// @brief 表現できないほど小さい値は、符号を保ったまま0になること。
TEST(NumberScannerTest, FloatUnderflowBecomesZero) {
    EXPECT_EQ(scanText("1e-400"), JsonTokenValue{NumVal{0.0}});
    EXPECT_FALSE(std::signbit(std::get<NumVal>(scanText("1e-400")).v));

    auto negative = scanText("-1e-400");
    ASSERT_TRUE(std::holds_alternative<NumVal>(negative));
    EXPECT_EQ(std::get<NumVal>(negative).v, 0.0);
    EXPECT_TRUE(std::signbit(std::get<NumVal>(negative).v));

    EXPECT_EQ(scanText("2.5E-999"), JsonTokenValue{NumVal{0.0}});
}

TEST(NumberScannerTest, FloatOverflowThrows) {
    try {
        scanText("1e400");
        FAIL() << "DecodeError expected";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("failed to scan float: value out of range"),
                  std::string::npos);
    }
    EXPECT_THROW(scanText("-1e400"), DecodeError);
}

TEST(NumberScannerTest, MalformedFloatsThrow) {
    EXPECT_THROW(scanText("4.."), DecodeError);
    EXPECT_THROW(scanText("."), DecodeError);
    EXPECT_THROW(scanText("1e"), DecodeError);
    EXPECT_THROW(scanText("1e400"), DecodeError);
}

TEST(NumberScannerTest, ConversionErrorMentionsKind) {
    try {
        scanText("4..");
        FAIL() << "DecodeError expected";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("failed to scan float"), std::string::npos);
    }
    try {
        scanText("99999999999999999999");
        FAIL() << "DecodeError expected";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("failed to scan int"), std::string::npos);
    }
}

// ********************************************************************************
// テストカテゴリ：境界
// ********************************************************************************

/// @brief 数値以外の文字で止まり、その文字を押し戻すこと。
TEST(NumberScannerTest, StopsAtNonNumberByte) {
    ChunkedByteSource source("394[", 2);
    ByteCursor<ChunkedByteSource> cursor(source);
    NumberScanner<ChunkedByteSource> scanner(cursor);
    EXPECT_EQ(scanner.scan(), JsonTokenValue{IntVal{394}});
    EXPECT_EQ(cursor.next(), '[');
}

/// @brief '+'は数値を構成しないため、"1e+3"は"1e"で止まって変換に失敗すること。
TEST(NumberScannerTest, PlusIsNotPartOfNumber) {
    EXPECT_THROW(scanText("1e+3"), DecodeError);
}

TEST(NumberScannerTest, LiteralAtScratchCapacitySucceeds) {
    // 先頭の'0'を並べて容量ちょうどの長さにする。
    std::string text(numberScratchCapacity - 2, '0');
    text += "42";
    ASSERT_EQ(text.size(), numberScratchCapacity);
    EXPECT_EQ(scanText(text), JsonTokenValue{IntVal{42}});
}

TEST(NumberScannerTest, LiteralOverScratchCapacityThrows) {
    std::string text(numberScratchCapacity + 1, '1');
    try {
        scanText(text);
        FAIL() << "DecodeError expected";
    } catch (const DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("number is too long"), std::string::npos);
    }
    EXPECT_THROW(scanText(std::string(100, '9')), DecodeError);
}
