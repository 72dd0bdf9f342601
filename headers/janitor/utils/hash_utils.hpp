//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_HASH_UTILS_HPP
#define JANITOR_HASH_UTILS_HPP

/**
 * @file hash_utils.hpp
 * @brief Content hashing for source units and cache keys (OpenSSL EVP).
 */

#include "janitor/result.hpp"
#include "janitor/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace janitor::hash_utils {

    /**
     * Lowercase hex SHA-256 of @p data.
     *
     * @throws std::runtime_error if the digest context cannot be used.
     */
    std::string sha256(std::string_view data);

    /**
     * SHA-256 of a file's contents.
     */
    Result<std::string, Error> sha256_file(const std::filesystem::path& path);

}  // namespace janitor::hash_utils

#endif //JANITOR_HASH_UTILS_HPP
