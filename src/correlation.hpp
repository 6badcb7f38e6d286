//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_CORRELATION_HPP
#define STATCALC_CORRELATION_HPP

#include "sample.hpp"
#include <optional>

struct CorrelationResult {
    double r;
    arma::uword n;
    std::optional<double> p_value;// Two-sided, only defined for n >= 3
};

/**
 * @brief Pearson's r computed directly from sums of products and squares.
 *
 * r = (n Sxy - Sx Sy) / sqrt((n Sxx - Sx^2)(n Syy - Sy^2)), clamped to [-1, 1].
 *
 * @throws InvalidInputError if the lengths differ or n < 2.
 * @throws DegenerateInputError if either sample is constant.
 */
CorrelationResult compute_pearson_r(const Sample &x, const Sample &y);

#endif//STATCALC_CORRELATION_HPP
