#include <gtest/gtest.h>

#include "errors.hpp"
#include "evaluator.hpp"

#include <limits>
#include <string>

using linecalc::ErrorKind;
using linecalc::EvaluationError;
using linecalc::EvaluatorLimits;
using linecalc::ExpressionEvaluator;

namespace {
// "1 + 1 + ... + 1" с заданным числом операций
std::string chainOfAdditions(std::size_t operations) {
    std::string text = "1";
    for (std::size_t i = 0; i < operations; ++i) {
        text += " + 1";
    }
    return text;
}

ErrorKind kindOfFailure(const std::string& text) {
    try {
        ExpressionEvaluator().evaluate(text);
    }
    catch (const EvaluationError& ex) {
        return ex.kind();
    }
    ADD_FAILURE() << "ожидалась ошибка для: " << text;
    return ErrorKind::InputShape;
}
}

TEST(EvaluatorTest, ComputesBasicArithmetic) {
    ExpressionEvaluator evaluator;
    EXPECT_EQ(evaluator.tryEvaluate("2 + 2"), "4");
    EXPECT_EQ(evaluator.tryEvaluate("10 / 2"), "5");
    EXPECT_EQ(evaluator.tryEvaluate("2 ^ 3"), "8");
    EXPECT_EQ(evaluator.tryEvaluate("10 % 3"), "1");
    EXPECT_EQ(evaluator.tryEvaluate("3 * 4"), "12");
    EXPECT_EQ(evaluator.tryEvaluate("7 / 2"), "3.5");
}

TEST(EvaluatorTest, ResultParsesBackToSameDouble) {
    auto result = ExpressionEvaluator().tryEvaluate("0.1 + 0.2");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(std::stod(*result), 0.1 + 0.2);
}

TEST(EvaluatorTest, ModuloKeepsSignOfDividend) {
    ExpressionEvaluator evaluator;
    EXPECT_EQ(evaluator.tryEvaluate("-7 % 3"), "-1");
    EXPECT_EQ(evaluator.tryEvaluate("7 % -3"), "1");
    EXPECT_EQ(evaluator.tryEvaluate("7.5 % 2"), "1.5");
}

TEST(EvaluatorTest, DivisionAndModulusByZeroGiveNoResult) {
    ExpressionEvaluator evaluator;
    EXPECT_FALSE(evaluator.tryEvaluate("1 / 0").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("1 % 0").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("1 / (2 - 2)").has_value());
    EXPECT_EQ(kindOfFailure("1 / 0"), ErrorKind::NumericInvalid);
}

TEST(EvaluatorTest, RejectsTextLongerThanLimit) {
    ExpressionEvaluator evaluator;
    std::string atLimit = "1" + std::string(999, ' ');
    std::string overLimit = "1" + std::string(1000, ' ');
    EXPECT_EQ(evaluator.tryEvaluate(atLimit), "1");
    EXPECT_FALSE(evaluator.tryEvaluate(overLimit).has_value());
    EXPECT_EQ(kindOfFailure(overLimit), ErrorKind::InputShape);
}

TEST(EvaluatorTest, LengthLimitCountsCharactersNotBytes) {
    // 978 символов, но 1016 байт: каждый "−" занимает три байта
    std::string text = "1." + std::string(900, '0');
    for (int i = 0; i < 19; ++i) {
        text += " \xE2\x88\x92 1";
    }
    ASSERT_GT(text.size(), 1000u);

    ExpressionEvaluator evaluator;
    EXPECT_EQ(evaluator.tryEvaluate(text), "-18");

    std::string atLimit = text + std::string(22, ' ');
    EXPECT_EQ(evaluator.tryEvaluate(atLimit), "-18");
    EXPECT_FALSE(evaluator.tryEvaluate(atLimit + " ").has_value());
    EXPECT_EQ(kindOfFailure(atLimit + " "), ErrorKind::InputShape);
}

TEST(EvaluatorTest, CountsMultiByteGlyphsAsSingleCharacters) {
    EvaluatorLimits limits;
    limits.maxLength = 5;
    ExpressionEvaluator evaluator(limits);
    EXPECT_EQ(evaluator.tryEvaluate("6" "\xC3\xB7" "2" "\xC3\x97" "3"), "9");
    EXPECT_FALSE(evaluator.tryEvaluate("6 \xC3\xB7 22").has_value());
}

TEST(EvaluatorTest, RejectsTreesDeeperThanTwenty) {
    ExpressionEvaluator evaluator;
    EXPECT_EQ(evaluator.tryEvaluate(chainOfAdditions(19)), "20");
    EXPECT_FALSE(evaluator.tryEvaluate(chainOfAdditions(20)).has_value());
    EXPECT_EQ(kindOfFailure(chainOfAdditions(20)), ErrorKind::UnsafeStructure);

    EXPECT_EQ(evaluator.tryEvaluate(std::string(19, '-') + "1"), "-1");
    EXPECT_FALSE(evaluator.tryEvaluate(std::string(20, '-') + "1").has_value());
}

TEST(EvaluatorTest, BoundsExponentMagnitude) {
    ExpressionEvaluator evaluator;
    EXPECT_FALSE(evaluator.tryEvaluate("2 ^ 1000").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("9999 ^ 9999").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("2 ^ -101").has_value());
    EXPECT_TRUE(evaluator.tryEvaluate("2 ^ 100").has_value());
    EXPECT_EQ(evaluator.tryEvaluate("2 ^ -1"), "0.5");
}

TEST(EvaluatorTest, RejectsOverflowNaNAndSubnormalResults) {
    ExpressionEvaluator evaluator;
    EXPECT_FALSE(evaluator.tryEvaluate("(10 ^ 100) ^ 4").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("(-8) ^ 0.5").has_value());
    EXPECT_FALSE(evaluator.tryEvaluate("10 ^ -100 * 10 ^ -100 * 10 ^ -100 * 10 ^ -10").has_value());
    EXPECT_TRUE(evaluator.tryEvaluate("10 ^ -100 * 10 ^ -100 * 10 ^ -100").has_value());
}

TEST(EvaluatorTest, RejectsAnythingOutsideGrammar) {
    ExpressionEvaluator evaluator;
    for (const char* text : {"", "abc", "2 + x", "print(1)", "+5", "1, 2", "2 ** 3", "1 e 5"}) {
        EXPECT_FALSE(evaluator.tryEvaluate(text).has_value()) << text;
    }
    EXPECT_EQ(kindOfFailure(""), ErrorKind::InputShape);
    EXPECT_EQ(kindOfFailure("+5"), ErrorKind::UnsafeStructure);
}

TEST(EvaluatorTest, NegativeZeroIsPrintedAsZero) {
    EXPECT_EQ(ExpressionEvaluator().tryEvaluate("-0"), "0");
}

TEST(EvaluatorTest, HonorsCustomLimits) {
    EvaluatorLimits limits;
    limits.maxLength = 10;
    ExpressionEvaluator evaluator(limits);
    EXPECT_EQ(evaluator.tryEvaluate("1 + 2"), "3");
    EXPECT_FALSE(evaluator.tryEvaluate("1 + 2 + 3 + 4").has_value());
}

TEST(FormatNumberTest, UsesShortestRoundTripForm) {
    EXPECT_EQ(linecalc::formatNumber(4.0), "4");
    EXPECT_EQ(linecalc::formatNumber(2.5), "2.5");
    EXPECT_EQ(linecalc::formatNumber(1000.0), "1000");
    EXPECT_EQ(linecalc::formatNumber(1e100), "1e+100");
    EXPECT_EQ(linecalc::formatNumber(-3.25), "-3.25");
}

TEST(IsValidResultTest, ChecksRangeAndNaN) {
    EXPECT_TRUE(linecalc::isValidResult(0.0));
    EXPECT_TRUE(linecalc::isValidResult(1.7e308));
    EXPECT_FALSE(linecalc::isValidResult(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(linecalc::isValidResult(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(linecalc::isValidResult(std::numeric_limits<double>::denorm_min()));
}
