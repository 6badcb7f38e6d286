//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_PARAMETERS_HPP
#define STATCALC_PARAMETERS_HPP

#include <fmt/ostream.h>
#include <optional>
#include <ostream>
#include <string>

/**
 * @brief Runtime parameters
 */
class Parameters {
public:
    std::string command;// ttest, correlation, or empty for the interactive menu
    std::optional<std::string> input_a;
    std::optional<std::string> input_b;
    std::optional<std::string> values_a;
    std::optional<std::string> values_b;
    double alpha = 0.05;
    std::string center = "median";
    bool verbose = false;

    void print(std::ostream &os) const {
        fmt::print(os, "Command: {}\n", command.empty() ? "interactive" : command);
        if (input_a) {
            fmt::print(os, "Input A: {}\n", *input_a);
        }
        if (input_b) {
            fmt::print(os, "Input B: {}\n", *input_b);
        }
        if (values_a) {
            fmt::print(os, "Values A: {}\n", *values_a);
        }
        if (values_b) {
            fmt::print(os, "Values B: {}\n", *values_b);
        }
        fmt::print(os, "Alpha: {}\n", alpha);
        fmt::print(os, "Levene Center: {}\n", center);
        fmt::print(os, "Verbose: {}\n", verbose);
    };
};

#endif//STATCALC_PARAMETERS_HPP
