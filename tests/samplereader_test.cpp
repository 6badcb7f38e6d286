// samplereader_test.cpp - tests for reading samples from streams, inline lists and files
//
// Tests for:
//   - Comma and whitespace separated values over several lines
//   - Comment and blank lines
//   - Parse errors naming line and token
//   - Empty fields between or after commas
//   - Plain, gzip and zstd compressed files, and stdin
//   - Missing files

#include <gtest/gtest.h>

#include "errors.hpp"
#include "iscompressed.hpp"
#include "samplereader.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string data_path(const std::string &file) {
    return std::string(STATCALC_TEST_DATA_DIR) + "/" + file;
}

// Points std::cin at another stream for the lifetime of the object.
class CinRedirect {
    std::streambuf *saved;

public:
    explicit CinRedirect(std::istream &is) : saved(std::cin.rdbuf(is.rdbuf())) {}
    ~CinRedirect() { std::cin.rdbuf(saved); }
};

}// namespace

// ===========================================================================
// Stream parsing
// ===========================================================================

TEST(SampleReaderTest, MixedSeparatorsAcrossLines) {
    std::istringstream is("1, 2,3\n4\t5  6\r\n7.5,-8e-1\n");
    SampleReader reader("Sample 1");
    reader.read(is);
    std::vector<double> expected{1, 2, 3, 4, 5, 6, 7.5, -0.8};
    EXPECT_EQ(reader.get_values(), expected);
}

TEST(SampleReaderTest, SkipsCommentsAndBlankLines) {
    std::istringstream is("# header\n\n   # indented comment\n10,20\n   \n30\n");
    SampleReader reader("Sample 1");
    reader.read(is);
    std::vector<double> expected{10, 20, 30};
    EXPECT_EQ(reader.get_values(), expected);
}

TEST(SampleReaderTest, ReportsLineAndToken) {
    std::istringstream is("1,2\n3,x4\n");
    SampleReader reader("Sample 2");
    try {
        reader.read(is);
        FAIL() << "Expected InvalidInputError";
    } catch (const InvalidInputError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("'x4'"), std::string::npos);
        EXPECT_NE(msg.find("line 2"), std::string::npos);
        EXPECT_NE(msg.find("Sample 2"), std::string::npos);
    }
}

TEST(SampleReaderTest, RejectsTrailingGarbage) {
    std::istringstream is("1.5abc\n");
    SampleReader reader("Sample 1");
    EXPECT_THROW(reader.read(is), InvalidInputError);
}

TEST(SampleReaderTest, NonFiniteTokensFailSampleValidation) {
    std::istringstream is("1, nan, 3\n");
    SampleReader reader("Sample 1");
    reader.read(is);
    EXPECT_EQ(reader.get_values().size(), 3u);
    EXPECT_THROW(reader.to_sample(), InvalidInputError);
}

// ===========================================================================
// Inline lists
// ===========================================================================

TEST(SampleReaderTest, ParseValuesInline) {
    std::vector<double> expected{2, 4, 4, 5.5};
    EXPECT_EQ(parse_values("2, 4,4 , 5.5", "Sample 1"), expected);
}

TEST(SampleReaderTest, ParseValuesEmpty) {
    EXPECT_TRUE(parse_values("", "Sample 1").empty());
    EXPECT_TRUE(parse_values("   ", "Sample 1").empty());
}

TEST(SampleReaderTest, EmptyFieldsAreRejected) {
    EXPECT_THROW(parse_values("1,,2", "Sample 1"), InvalidInputError);
    EXPECT_THROW(parse_values("1,", "Sample 1"), InvalidInputError);
    EXPECT_THROW(parse_values(",1", "Sample 1"), InvalidInputError);
    EXPECT_THROW(parse_values("1, ,2", "Sample 1"), InvalidInputError);
    EXPECT_THROW(parse_values(" , ,", "Sample 1"), InvalidInputError);
}

TEST(SampleReaderTest, EmptyFieldNamesLine) {
    std::istringstream is("1,2\n3,,4\n");
    SampleReader reader("Sample 2");
    try {
        reader.read(is);
        FAIL() << "Expected InvalidInputError";
    } catch (const InvalidInputError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Empty value"), std::string::npos);
        EXPECT_NE(msg.find("line 2"), std::string::npos);
    }
}

TEST(SampleReaderTest, ParseValuesInvalid) {
    EXPECT_THROW(parse_values("1, two, 3", "Sample 1"), InvalidInputError);
}

// ===========================================================================
// Files
// ===========================================================================

TEST(SampleReaderTest, ReadsPlainFile) {
    Sample s = read_sample(data_path("textbook_a.txt"), "Sample 1");
    EXPECT_EQ(s.name(), "Sample 1");
    ASSERT_EQ(s.size(), 8u);
    EXPECT_DOUBLE_EQ(s.mean(), 5.0);
}

TEST(SampleReaderTest, ReadsGzipFile) {
    EXPECT_EQ(is_compressed(data_path("textbook_b.txt.gz")), CompressionType::gzip);
    EXPECT_EQ(is_compressed(data_path("textbook_b.txt")), CompressionType::uncompressed);

    Sample gz = read_sample(data_path("textbook_b.txt.gz"), "Sample 2");
    Sample plain = read_sample(data_path("textbook_b.txt"), "Sample 2");
    ASSERT_EQ(gz.size(), 8u);
    EXPECT_DOUBLE_EQ(gz.mean(), plain.mean());
    EXPECT_DOUBLE_EQ(gz.variance(), 6.0);
}

TEST(SampleReaderTest, ReadsZstdFile) {
    EXPECT_EQ(is_compressed(data_path("textbook_b.txt.zst")), CompressionType::zstd);

    Sample zst = read_sample(data_path("textbook_b.txt.zst"), "Sample 2");
    ASSERT_EQ(zst.size(), 8u);
    EXPECT_DOUBLE_EQ(zst.mean(), 4.5);
    EXPECT_DOUBLE_EQ(zst.variance(), 6.0);
}

TEST(SampleReaderTest, DashReadsStdin) {
    std::istringstream input("# piped\n2,4,4,4\n5 5 7 9\n");
    CinRedirect redirect(input);
    Sample s = read_sample("-", "Sample 1");
    ASSERT_EQ(s.size(), 8u);
    EXPECT_DOUBLE_EQ(s.mean(), 5.0);
    EXPECT_DOUBLE_EQ(s.variance(), 32.0 / 7.0);
}

TEST(SampleReaderTest, MalformedFile) {
    EXPECT_THROW(read_sample(data_path("malformed.txt"), "Sample 1"), InvalidInputError);
}

TEST(SampleReaderTest, MissingFile) {
    EXPECT_THROW(read_sample(data_path("does_not_exist.txt"), "Sample 1"), InvalidInputError);
}
