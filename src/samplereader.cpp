//
// Created by StatCalc contributors on 10/19/26.
//

#include "samplereader.hpp"
#include "errors.hpp"
#include "source.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>
#include <fmt/format.h>
#include <utility>

SampleReader::SampleReader(std::string name)
    : name(std::move(name)) {}

void SampleReader::parse_line(const std::string &line, size_t line_no) {
    std::string line_trim = boost::trim_copy(line);
    if (line_trim.empty() || boost::starts_with(line_trim, "#")) {
        return;
    }

    // Commas delimit fields and must not be doubled or trailing; whitespace may separate values inside a field.
    boost::char_separator<char> comma(",", "", boost::keep_empty_tokens);
    boost::char_separator<char> blank(" \t\r");
    boost::tokenizer<boost::char_separator<char>> fields(line_trim, comma);
    size_t field_no = 0;
    for (const auto &field : fields) {
        field_no++;
        std::string field_trim = boost::trim_copy(field);
        if (field_trim.empty()) {
            throw(InvalidInputError(fmt::format("Empty value in field {} at line {} in {}.", field_no, line_no, name)));
        }
        boost::tokenizer<boost::char_separator<char>> tokens(field_trim, blank);
        for (const auto &token : tokens) {
            parse_token(token, line_no);
        }
    }
}

void SampleReader::parse_token(const std::string &token, size_t line_no) {
    size_t pos = 0;
    double value;
    try {
        value = std::stod(token, &pos);
    } catch (std::exception &e) {
        throw(InvalidInputError(fmt::format("Failed to parse '{}' at line {} in {}.", token, line_no, name)));
    }
    if (pos != token.size()) {
        throw(InvalidInputError(fmt::format("Failed to parse '{}' at line {} in {}.", token, line_no, name)));
    }
    values.push_back(value);
}

void SampleReader::read(std::istream &is) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(is, line)) {
        line_no++;
        parse_line(line, line_no);
    }
    if (is.bad()) {
        throw(InvalidInputError(fmt::format("Error while reading {}.", name)));
    }
}

Sample SampleReader::to_sample() const {
    return Sample(name, values);
}

std::vector<double> parse_values(const std::string &line, const std::string &name) {
    SampleReader reader(name);
    reader.parse_line(line, 1);
    return reader.get_values();
}

Sample read_sample(const std::string &path, const std::string &name) {
    Source source(path);
    std::istream is(&(*source.streambuf));

    SampleReader reader(name);
    reader.read(is);
    return reader.to_sample();
}
