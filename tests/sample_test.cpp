// sample_test.cpp - tests for Sample validation and descriptive statistics
//
// Tests for:
//   - Rejection of non-finite observations
//   - Minimum size checks
//   - Mean, n - 1 variance, standard deviation, median

#include <gtest/gtest.h>

#include "errors.hpp"
#include "sample.hpp"

#include <cmath>
#include <limits>
#include <vector>

TEST(SampleTest, StoresNameAndValues) {
    Sample s("Sample 1", std::vector<double>{1.0, 2.0, 3.0});
    EXPECT_EQ(s.name(), "Sample 1");
    EXPECT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.data()(2), 3.0);
}

TEST(SampleTest, RejectsNaN) {
    std::vector<double> v{1.0, std::numeric_limits<double>::quiet_NaN(), 3.0};
    EXPECT_THROW(Sample("Sample 1", v), InvalidInputError);
}

TEST(SampleTest, RejectsInfinity) {
    std::vector<double> v{1.0, 2.0, -std::numeric_limits<double>::infinity()};
    EXPECT_THROW(Sample("Sample 2", v), InvalidInputError);
}

TEST(SampleTest, ErrorNamesSampleAndPosition) {
    std::vector<double> v{1.0, std::numeric_limits<double>::infinity()};
    try {
        Sample s("Sample 2", v);
        FAIL() << "Expected InvalidInputError";
    } catch (const InvalidInputError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Sample 2"), std::string::npos);
        EXPECT_NE(msg.find("position 2"), std::string::npos);
    }
}

TEST(SampleTest, RequireAtLeast) {
    Sample s("Sample 1", std::vector<double>{4.0});
    EXPECT_NO_THROW(s.require_at_least(1));
    EXPECT_THROW(s.require_at_least(2), InvalidInputError);
}

TEST(SampleTest, TextbookMeanAndVariance) {
    Sample s("A", std::vector<double>{2, 4, 4, 4, 5, 5, 7, 9});
    EXPECT_DOUBLE_EQ(s.mean(), 5.0);
    EXPECT_NEAR(s.variance(), 32.0 / 7.0, 1e-12);
    EXPECT_NEAR(s.standard_deviation(), std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_DOUBLE_EQ(s.median(), 4.5);
}

TEST(SampleTest, VarianceNeedsTwoObservations) {
    Sample s("A", std::vector<double>{4.0});
    EXPECT_DOUBLE_EQ(s.mean(), 4.0);
    EXPECT_THROW(s.variance(), InvalidInputError);
}

TEST(SampleTest, EmptySampleHasNoMean) {
    Sample s("A", std::vector<double>{});
    EXPECT_EQ(s.size(), 0u);
    EXPECT_THROW(s.mean(), InvalidInputError);
}

TEST(SampleTest, ConstantSampleHasZeroVariance) {
    Sample s("A", std::vector<double>{3, 3, 3, 3});
    EXPECT_DOUBLE_EQ(s.variance(), 0.0);
}
