//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_SAMPLE_HPP
#define STATCALC_SAMPLE_HPP

#include <armadillo>
#include <string>
#include <vector>

/**
 * @brief An immutable sequence of finite observations.
 *
 * The name is only used to identify the sample in error messages, e.g.
 * "Sample 1" or "X (First Variable)".
 */
class Sample {
    std::string name_;
    arma::vec data_;

    void validate() const;

public:
    Sample(std::string name, arma::vec data);
    Sample(std::string name, const std::vector<double> &data);

    const std::string &name() const { return name_; }
    const arma::vec &data() const { return data_; }
    arma::uword size() const { return data_.n_elem; }

    /**
     * @brief Throw InvalidInputError unless the sample holds at least n observations.
     * @param n Minimum number of observations.
     */
    void require_at_least(arma::uword n) const;

    double mean() const;
    double variance() const; // n - 1 denominator
    double standard_deviation() const;
    double median() const;
};

#endif//STATCALC_SAMPLE_HPP
