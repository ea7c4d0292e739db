/**
 * @file token.hpp
 * @brief Random correlation tokens.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/utils/export.hpp"

#include <cstddef>
#include <string>

namespace lumen {
namespace utils {

/**
 * @class TokenGenerator
 * @brief Thread-safe generator of short random alphanumeric tokens.
 *
 * Tokens are drawn uniformly from [0-9a-z]. At the default length of 12
 * there are 36^12 (~4.7e18) possible values, so collisions between
 * concurrently outstanding requests are negligible.
 *
 * Usage:
 * @code
 * std::string id = TokenGenerator::generate();   // e.g. "k3v0q9zt1mfa"
 * @endcode
 */
class LUMEN_UTILS_API TokenGenerator {
public:
    static constexpr std::size_t kDefaultLength = 12;
    static constexpr std::size_t kMinimumLength = 9;

    /**
     * @brief Generate a new token.
     * @param length Number of characters; values below kMinimumLength are raised to it.
     */
    static std::string generate(std::size_t length = kDefaultLength);

    /**
     * @brief Check that a string only contains token characters.
     */
    static bool isValid(const std::string& token);
};

}  // namespace utils
}  // namespace lumen
