/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/crypto/difficulty.hpp"

#include <cmath>
#include <limits>

namespace powgate {
namespace crypto {

namespace {

std::uint32_t byte_leading_zeros(std::uint8_t byte) {
    std::uint32_t n = 0;
    for (std::uint8_t mask = 0x80; mask != 0 && (byte & mask) == 0; mask >>= 1) {
        ++n;
    }
    return n;
}

} // namespace

std::uint32_t leading_zero_bits(const std::uint8_t* bytes, std::size_t len) {
    std::uint32_t count = 0;
    for (std::size_t i = 0; i < len; ++i) {
        if (bytes[i] != 0) {
            // First non-zero byte ends the run
            return count + byte_leading_zeros(bytes[i]);
        }
        count += 8;
    }
    return count;
}

bool meets_cost(const Digest& digest, std::uint32_t cost) {
    return leading_zero_bits(digest.data(), digest.size()) >= cost;
}

double expected_attempts(std::uint32_t cost) {
    // No digest can meet such a cost
    if (cost > kDigestBits) return std::numeric_limits<double>::infinity();
    return std::ldexp(1.0, static_cast<int>(cost));
}

double success_probability(std::uint32_t cost, std::uint64_t meter) {
    if (cost == 0) return meter > 0 ? 1.0 : 0.0;
    if (cost > kDigestBits || meter == 0) return 0.0;

    const int exponent = static_cast<int>(cost);  // at most kDigestBits here
    // 1 - (1 - p)^m, computed via log1p/expm1 so tiny p does not round to zero
    const double p = std::ldexp(1.0, -exponent);
    return -std::expm1(static_cast<double>(meter) * std::log1p(-p));
}

std::uint32_t meter_for(double attempts_per_second, double seconds) {
    if (!(attempts_per_second > 0.0) || !(seconds > 0.0)) return 0;
    const double attempts = std::ceil(attempts_per_second * seconds);
    if (attempts >= static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(attempts);
}

} // namespace crypto
} // namespace powgate
