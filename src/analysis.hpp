//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_ANALYSIS_HPP
#define STATCALC_ANALYSIS_HPP

#include "correlation.hpp"
#include "levene.hpp"
#include "sample.hpp"
#include "ttest.hpp"
#include <string>

struct TTestReport {
    VarianceDecision levene;
    TTestResult ttest;
};

/**
 * @brief Run Levene's test and feed its decision into the t-test.
 * @param alpha Significance threshold of the equal-variance decision.
 * @param center Levene centre, see LeveneTest::centers.
 */
TTestReport run_t_test(const Sample &a, const Sample &b, double alpha = 0.05, const std::string &center = "median");

CorrelationResult run_correlation(const Sample &x, const Sample &y);

#endif//STATCALC_ANALYSIS_HPP
