#include <gtest/gtest.h>

#include <set>

#include "fiscal/utils/DateTimeFormatter.hpp"
#include "fiscal/utils/IdGenerator.hpp"
#include "fiscal/utils/NumberFormatter.hpp"
#include "fiscal/utils/TextUtils.hpp"

using namespace fiscal::utils;

TEST(NumberFormatterTest, AmountsHaveTwoDecimals) {
    EXPECT_EQ(formatAmount(3), "3.00");
    EXPECT_EQ(formatAmount(1.005 + 1e-9), "1.01");
    EXPECT_EQ(formatAmount(-12.5), "-12.50");
    EXPECT_EQ(formatAmount(-0.001), "0.00");
}

TEST(NumberFormatterTest, QuantitiesDropTrailingZeros) {
    EXPECT_EQ(formatQuantity(2), "2");
    EXPECT_EQ(formatQuantity(1.5), "1.5");
    EXPECT_EQ(formatQuantity(0.125), "0.125");
    EXPECT_EQ(formatQuantity(-0.0001), "0");
}

TEST(NumberFormatterTest, ParseAmountIsStrict) {
    EXPECT_DOUBLE_EQ(*parseAmount(" 125.50 "), 125.5);
    EXPECT_DOUBLE_EQ(*parseAmount("-3"), -3.0);
    EXPECT_FALSE(parseAmount("").has_value());
    EXPECT_FALSE(parseAmount("12,50").has_value());
    EXPECT_FALSE(parseAmount("12.5abc").has_value());
}

TEST(TextUtilsTest, CyrillicIsEncodedAsWindows1251) {
    EXPECT_EQ(toWindows1251("Bread"), "Bread");
    EXPECT_EQ(toWindows1251("Хляб"), "\xD5\xEB\xFF\xE1");
    EXPECT_EQ(toWindows1251("€"), "\x88");
    EXPECT_EQ(toWindows1251("№1"), "\xB9" "1");
}

TEST(TextUtilsTest, UnmappedCharactersBecomeQuestionMarks) {
    EXPECT_EQ(toWindows1251("日"), "?");
    EXPECT_EQ(toWindows1251("a\xC3"), "a?");
}

TEST(TextUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(split("a;;b;", ';'), (std::vector<std::string>{"a", "", "b", ""}));
    EXPECT_EQ(split("", ','), (std::vector<std::string>{""}));
}

TEST(TextUtilsTest, Helpers) {
    EXPECT_EQ(trim("  ZK123456 \r\n"), "ZK123456");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLower("ZK123456"), "zk123456");
    EXPECT_EQ(toHex(std::string{'\x01', '\xAB'}), "01 AB");
    EXPECT_EQ(padRight("ab", 4), "ab  ");
    EXPECT_EQ(padRight("abcdef", 4), "abcdef");
    EXPECT_EQ(withMaxLength("abcdef", 4), "abcd");
    EXPECT_EQ(withMaxLength("ab", 4), "ab");
}

TEST(DateTimeFormatterTest, FormatsDeviceLayouts) {
    auto dt = makeDateTime(2024, 5, 17, 10, 30, 5);
    EXPECT_EQ(formatDateTime(dt, formats::Iso), "2024-05-17T10:30:05");
    EXPECT_EQ(formatDateTime(dt, formats::ShortYear), "17-05-24 10:30:05");
    EXPECT_EQ(formatDateTime(dt, formats::ReportDate), "170524");
    EXPECT_EQ(formatDateTime(dt, formats::DayMonth), "1705");
}

TEST(DateTimeFormatterTest, ParsesWholeText) {
    auto parsed = parseDateTime("17-05-2024 10:30", formats::LongYearNoSeconds);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(sameDateTime(*parsed, makeDateTime(2024, 5, 17, 10, 30)));

    EXPECT_FALSE(parseDateTime("17-05-2024 10:30 extra", formats::LongYearNoSeconds).has_value());
    EXPECT_FALSE(parseDateTime("garbage", formats::LongYearNoSeconds).has_value());
}

TEST(DateTimeFormatterTest, TwoDigitYearsAreThisCentury) {
    auto parsed = parseDateTime("17-05-24 10:30:05", formats::ShortYear);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->tm_year, 124);
}

TEST(DateTimeFormatterTest, FourDigitYearsAreTakenAsWritten) {
    auto parsed = parseIsoDateTime("1960-01-02T03:04:05");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->tm_year, 60);

    auto longYear = parseDateTime("17-05-1968 10:30", formats::LongYearNoSeconds);
    ASSERT_TRUE(longYear.has_value());
    EXPECT_EQ(longYear->tm_year, 68);
}

TEST(DateTimeFormatterTest, IsoAcceptsFractionAndZoneSuffix) {
    auto parsed = parseIsoDateTime("2024-05-17T10:30:00.123+03:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(sameDateTime(*parsed, makeDateTime(2024, 5, 17, 10, 30)));
    EXPECT_FALSE(parseIsoDateTime("2024-05-17").has_value());
}

TEST(IdGeneratorTest, UrlSafeAndUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generateUrlSafeId();
        ASSERT_EQ(id.size(), 22u);
        EXPECT_EQ(id.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"),
                  std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}
