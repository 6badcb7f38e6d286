//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_TTEST_HPP
#define STATCALC_TTEST_HPP

#include "sample.hpp"

struct TTestResult {
    double t_statistic;
    double degrees_of_freedom;
    double variance_a;
    double variance_b;

    double mean_a;
    double mean_b;
    arma::uword n_a;
    arma::uword n_b;
    double standard_error;
    double p_value;// Two-sided, Student's t on degrees_of_freedom
    bool pooled;   // Pooled variance formula, otherwise Welch
    bool unbalanced;
};

/**
 * @brief Largest relative difference in sample size before a result is flagged as unbalanced.
 */
constexpr double max_size_imbalance = 0.1;

/**
 * @brief Compute the t-statistic for the difference in means of two samples.
 *
 * When equal_variances is set the pooled variance is used with
 * n_a + n_b - 2 degrees of freedom. Otherwise the Welch standard error and
 * Welch-Satterthwaite degrees of freedom are used. The equal-variance
 * decision is normally the output of test_equal_variances().
 *
 * @throws InvalidInputError if either sample has fewer than 2 observations.
 * @throws DegenerateInputError if the standard error is zero.
 */
TTestResult compute_t_test(const Sample &a, const Sample &b, bool equal_variances);

#endif//STATCALC_TTEST_HPP
