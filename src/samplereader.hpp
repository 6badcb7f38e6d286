//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_SAMPLEREADER_HPP
#define STATCALC_SAMPLEREADER_HPP

#include "sample.hpp"
#include <istream>
#include <string>
#include <vector>

/**
 * @brief Accumulates numeric values line by line.
 *
 * Values are separated by commas and/or whitespace and may span any number
 * of lines. Blank lines and lines starting with '#' are skipped. Any token
 * that is not entirely a number, and any empty field between or after
 * commas, raises InvalidInputError with the line number.
 */
class SampleReader {
    std::string name;
    std::vector<double> values;

    void parse_token(const std::string &token, size_t line_no);

public:
    explicit SampleReader(std::string name);

    void parse_line(const std::string &line, size_t line_no);
    void read(std::istream &is);

    const std::vector<double> &get_values() const { return values; }
    Sample to_sample() const;
};

/**
 * @brief Parse an inline comma-separated list such as "1, 2.5, 3".
 */
std::vector<double> parse_values(const std::string &line, const std::string &name);

/**
 * @brief Read a sample from a plain or compressed file, or "-" for stdin.
 */
Sample read_sample(const std::string &path, const std::string &name);

#endif//STATCALC_SAMPLEREADER_HPP
