//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_ISCOMPRESSED_HPP
#define STATCALC_ISCOMPRESSED_HPP

#include "errors.hpp"
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>

enum class CompressionType {
    gzip,
    zstd,
    uncompressed
};

/**
* @brief Checks the leading bytes of a file against the gzip and zstd magic numbers.
* @tparam StringT Some string type, e.g., string or string_view
* @param file_path Path to a sample file that may be compressed.
* @return The detected compression, uncompressed if neither magic number matches.
*/
template<class StringT>
CompressionType is_compressed(StringT file_path) {
    const uint8_t zstdref[4] = {0x28, 0xB5, 0x2F, 0xFD};
    const uint8_t gzipref[2] = {0x1F, 0x8B};
    uint8_t magic[4] = {0, 0, 0, 0};
    std::ifstream isource(file_path, std::ios_base::binary);
    if (!isource.good()) {
        throw(InvalidInputError("Cannot open sample file: " + std::string(file_path)));
    }
    isource.read((char *)magic, sizeof(magic));
    auto nread = static_cast<size_t>(isource.gcount());

    if (nread >= sizeof(gzipref) && memcmp(magic, gzipref, sizeof(gzipref)) == 0) {
        return CompressionType::gzip;
    } else if (nread >= sizeof(zstdref) && memcmp(magic, zstdref, sizeof(zstdref)) == 0) {
        // Magic Number: 0xFD2FB528
        return CompressionType::zstd;
    } else {
        return CompressionType::uncompressed;
    }
}

#endif//STATCALC_ISCOMPRESSED_HPP
