//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_SOURCE_HPP
#define STATCALC_SOURCE_HPP

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <fstream>
#include <memory>
#include <string>

/**
 * @brief Owns the file and the decompression chain reading from it.
 *
 * Usage:
 *   Source source(path);
 *   std::istream is(&(*source.streambuf));
 *
 * The path "-" reads standard input, uncompressed.
 */
struct Source {
    std::ifstream ifs;
    std::unique_ptr<boost::iostreams::filtering_streambuf<boost::iostreams::input>> streambuf;

    explicit Source(const std::string &path);
};

#endif//STATCALC_SOURCE_HPP
