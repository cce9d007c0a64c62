#pragma once

#include <cstddef>
#include <cstdint>

#include <powgate/crypto/hasher.hpp>

namespace powgate::crypto {

// Count of consecutive zero bits from the most significant bit of bytes[0].
std::uint32_t leading_zero_bits(const std::uint8_t* bytes, std::size_t len);

// True if the digest starts with at least `cost` zero bits. Costs above
// kDigestBits are never met.
bool meets_cost(const Digest& digest, std::uint32_t cost);

// Mean number of attempts needed to meet `cost` (2^cost); infinity above kDigestBits.
double expected_attempts(std::uint32_t cost);

// Probability that `meter` independent attempts meet `cost` at least once.
double success_probability(std::uint32_t cost, std::uint64_t meter);

// Meter giving roughly `seconds` of work at the measured rate, clamped to u32.
std::uint32_t meter_for(double attempts_per_second, double seconds);

} // namespace powgate::crypto
