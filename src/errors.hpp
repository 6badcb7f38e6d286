//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_ERRORS_HPP
#define STATCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Malformed input.
 *
 * Raised for samples that are too short, samples of mismatched length,
 * non-finite values, unparsable tokens and unreadable files.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string &what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Well-formed input whose statistic has a zero denominator.
 */
class DegenerateInputError : public std::domain_error {
public:
    explicit DegenerateInputError(const std::string &what)
        : std::domain_error(what) {}
};

#endif//STATCALC_ERRORS_HPP
