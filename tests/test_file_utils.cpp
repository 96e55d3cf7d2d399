#include <gtest/gtest.h>

#include "file_utils.hpp"

#include <filesystem>
#include <fstream>

using namespace linecalc;

class FileUtilsTest : public ::testing::Test {
protected:
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / "linecalc_file_utils_test.txt";

    void writeFile(const std::string& content) {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        output << content;
    }

    void TearDown() override { std::filesystem::remove(path); }
};

TEST_F(FileUtilsTest, ReadsLinesKeepingBlanksAndStrippingCarriageReturns) {
    writeFile("x = 5\r\n\r\nx + 1");
    EXPECT_EQ(readLines(path), (std::vector<std::string>{"x = 5", "", "x + 1"}));
}

TEST_F(FileUtilsTest, ReadingMissingFileThrows) {
    EXPECT_THROW(readLines(path.parent_path() / "linecalc_no_such_file.txt"), std::runtime_error);
}

TEST_F(FileUtilsTest, LoadsCurrencyRatesSkippingComments) {
    writeFile("# курсы за 1 USD\nEUR 0.92\n\n  gbp   0.79  \n");
    auto rates = loadCurrencyRates(path);
    ASSERT_EQ(rates.size(), 2u);
    EXPECT_DOUBLE_EQ(rates.at("EUR"), 0.92);
    EXPECT_DOUBLE_EQ(rates.at("gbp"), 0.79);
}

TEST_F(FileUtilsTest, RejectsMalformedRateLines) {
    writeFile("EUR 0.92\nGBP\n");
    EXPECT_THROW(loadCurrencyRates(path), std::runtime_error);

    writeFile("EUR -1\n");
    EXPECT_THROW(loadCurrencyRates(path), std::runtime_error);
}

TEST(CurrentTimeStringTest, HasDateAndTimeParts) {
    std::string stamp = getCurrentTimeString();
    ASSERT_EQ(stamp.size(), 15u);
    EXPECT_EQ(stamp[8], '_');
}
