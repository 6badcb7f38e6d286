//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_LEVENE_HPP
#define STATCALC_LEVENE_HPP

#include "sample.hpp"
#include <string>
#include <vector>

/**
 * @brief Outcome of the equal-variance check that precedes the t-test.
 */
struct VarianceDecision {
    double statistic;    // Levene's W, F distributed on (1, N - 2) df
    double p_value;
    bool equal_variances;// p_value > threshold
    double threshold;
    std::string center;
};

/**
 * @brief Levene's test with a configurable centre.
 *
 * Each observation is replaced by its absolute deviation from the centre of
 * its own group and a one-way ANOVA F-test is run on those deviations.
 *
 * Centres:
 *   median  -- Brown-Forsythe variant, the default
 *   mean    -- Levene's original test
 *   trimmed -- both samples sorted and trimmed by 5% at each end, centred on the mean
 */
class LeveneTest {
public:
    enum class CenterID {
        Median,
        Mean,
        Trimmed
    };

    static const std::vector<std::string> centers;
    static constexpr double trim_proportion = 0.05;

    const CenterID centerid;
    const std::string centername;
    const double threshold;

    explicit LeveneTest(double threshold = 0.05, const std::string &center = "median");

    VarianceDecision test(const Sample &a, const Sample &b) const;

    static CenterID check_centerid(const std::string &center);
    static double check_threshold(double threshold);

private:
    arma::vec deviations(const Sample &s) const;
};

/**
 * @brief Decide whether two samples have equal variances.
 * @param a First sample, at least 2 observations.
 * @param b Second sample, at least 2 observations.
 * @param threshold Significance level; variances are called equal when p > threshold.
 * @param center One of LeveneTest::centers.
 */
VarianceDecision test_equal_variances(const Sample &a,
                                      const Sample &b,
                                      double threshold = 0.05,
                                      const std::string &center = "median");

#endif//STATCALC_LEVENE_HPP
