#pragma once

#include <cstdint>
#include <string>

namespace powgate::config {

// Decimal unsigned 32-bit value, digits only. Sets 'err' on failure.
bool parse_u32(const std::string& text, std::uint32_t& value, std::string& err);

// Cost must not exceed the digest bit length (256).
bool is_valid_cost(std::uint32_t cost, std::string& err);

// Worker thread count in [1..kMaxThreads].
bool is_valid_threads(std::uint32_t threads, std::string& err);

bool is_valid_algo(const std::string& algo, std::string& err);

constexpr std::uint32_t kMaxThreads = 256;

} // namespace powgate::config
