//
// Created by StatCalc contributors on 10/19/26.
//

#include "source.hpp"
#include "errors.hpp"
#include "iscompressed.hpp"
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zstd.hpp>
#include <iostream>

/**
 * @brief Extend the lifetime of the filtering stream.
 * @param path Path to a file that may be compressed, or "-" for stdin.
 */
Source::Source(const std::string &path) {
    streambuf = std::make_unique<boost::iostreams::filtering_streambuf<boost::iostreams::input>>();
    if (path == "-") {
        (*streambuf).push(std::cin);
        return;
    }
    switch (is_compressed(path)) {
        case CompressionType::gzip:
            ifs.open(path, std::ios_base::in | std::ios_base::binary);
            (*streambuf).push(boost::iostreams::gzip_decompressor());
            (*streambuf).push(ifs);
            break;
        case CompressionType::zstd:
            ifs.open(path, std::ios_base::in | std::ios_base::binary);
            (*streambuf).push(boost::iostreams::zstd_decompressor());
            (*streambuf).push(ifs);
            break;
        case CompressionType::uncompressed:
            ifs.open(path, std::ios_base::in);
            (*streambuf).push(ifs);
            break;
        default: break;
    }
    if (!ifs.is_open()) {
        throw(InvalidInputError("Cannot open sample file: " + path));
    }
}
