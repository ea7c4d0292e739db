/**
 * @file token.cpp
 * @brief TokenGenerator implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/utils/token.hpp"

#include <random>

namespace lumen {
namespace utils {

namespace {

constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;

}  // namespace

std::string TokenGenerator::generate(std::size_t length) {
    if (length < kMinimumLength) {
        length = kMinimumLength;
    }

    // One engine per thread, so no locking is needed
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::size_t> dist(0, kAlphabetSize - 1);

    std::string token;
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        token.push_back(kAlphabet[dist(gen)]);
    }
    return token;
}

bool TokenGenerator::isValid(const std::string& token) {
    if (token.size() < kMinimumLength) {
        return false;
    }
    for (char c : token) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'))) {
            return false;
        }
    }
    return true;
}

}  // namespace utils
}  // namespace lumen
