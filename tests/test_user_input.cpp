#include <gtest/gtest.h>

#include "user_input.hpp"

#include <stdexcept>

using namespace linecalc;

TEST(ParseArgumentsTest, DefaultsToInteractiveMode) {
    auto options = parseArguments({});
    EXPECT_EQ(options.mode, RunMode::Interactive);
    EXPECT_GT(options.threadCount, 0u);
    EXPECT_FALSE(options.verbose);
}

TEST(ParseArgumentsTest, ReadsSingleExpression) {
    auto options = parseArguments({"-e", "2 + 2", "-v"});
    EXPECT_EQ(options.mode, RunMode::Expression);
    EXPECT_EQ(options.expression, "2 + 2");
    EXPECT_TRUE(options.verbose);
}

TEST(ParseArgumentsTest, CollectsSeveralFiles) {
    auto options = parseArguments({"--file", "a.txt", "b.txt", "-t", "3", "-r", "rates.txt", "-c"});
    EXPECT_EQ(options.mode, RunMode::Files);
    ASSERT_EQ(options.files.size(), 2u);
    EXPECT_EQ(options.files[1].string(), "b.txt");
    EXPECT_EQ(options.threadCount, 3u);
    ASSERT_TRUE(options.ratesPath.has_value());
    EXPECT_EQ(options.ratesPath->string(), "rates.txt");
    EXPECT_TRUE(options.csvBesideInput);
}

TEST(ParseArgumentsTest, OutputRequiresExactlyOneFile) {
    EXPECT_NO_THROW(parseArguments({"-f", "a.txt", "-o", "out.csv"}));
    EXPECT_THROW(parseArguments({"-o", "out.csv"}), std::runtime_error);
    EXPECT_THROW(parseArguments({"-f", "a.txt", "b.txt", "-o", "out.csv"}), std::runtime_error);
}

TEST(ParseArgumentsTest, RejectsBadInput) {
    EXPECT_THROW(parseArguments({"-x"}), std::runtime_error);
    EXPECT_THROW(parseArguments({"-e"}), std::runtime_error);
    EXPECT_THROW(parseArguments({"-e", "1", "-f", "a.txt"}), std::runtime_error);
    EXPECT_THROW(parseArguments({"-t", "zero"}), std::runtime_error);
}

TEST(ParseArgumentsTest, HelpStopsParsing) {
    EXPECT_EQ(parseArguments({"-h", "-x"}).mode, RunMode::Help);
}

TEST(ParseNumberTest, AcceptsOnlyPositiveIntegers) {
    EXPECT_EQ(parseNumber("12"), 12u);
    EXPECT_THROW(parseNumber("0"), std::runtime_error);
    EXPECT_THROW(parseNumber("1x"), std::runtime_error);
    EXPECT_THROW(parseNumber(""), std::runtime_error);
}
