//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_INTERACTIVE_HPP
#define STATCALC_INTERACTIVE_HPP

#include "parameters.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief The interactive statistics calculator.
 *
 * Presents a menu (t-test, correlation, exit), prompts for comma-separated
 * samples and prints the results. Invalid sample entries are re-prompted,
 * calculation errors are reported and control returns to the menu. The loop
 * ends on the exit choice or at end of input.
 */
class Interactive {
    std::istream &in;
    std::ostream &out;
    Parameters params;

    std::optional<std::vector<double>> get_sample_input(const std::string &sample_name);
    void t_test();
    void correlation();

public:
    Interactive(std::istream &in_, std::ostream &out_, Parameters params_);

    void run();
};

#endif//STATCALC_INTERACTIVE_HPP
