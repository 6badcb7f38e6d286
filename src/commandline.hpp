//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_COMMANDLINE_HPP
#define STATCALC_COMMANDLINE_HPP

#include "parameters.hpp"
#include <CLI/CLI.hpp>

/**
 * @brief Accepts a significance threshold strictly between 0 and 1.
 */
extern const CLI::Validator OpenUnitInterval;

/**
 * @brief The statcalc option set, bound to a Parameters instance.
 *
 * --verbose, --alpha and --center belong to the top level app so the
 * interactive menu honours them. The subcommands fall through to it, so
 * `statcalc ttest --alpha 0.1 ...` works as well.
 */
class CommandLine {
public:
    Parameters params;
    CLI::App app;
    CLI::App *ttest;
    CLI::App *correlation;

    CommandLine();

    // Record the chosen subcommand in params.command. Call after parsing.
    void resolve();
};

#endif//STATCALC_COMMANDLINE_HPP
