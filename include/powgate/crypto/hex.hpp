/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <powgate/crypto/bytes.hpp>

namespace powgate {
namespace crypto {

// Lower-case hex, two characters per byte
std::string bytes_to_hex(ByteView bytes);

// Strict decoding: odd length or any non-hex character yields nullopt.
// Upper and lower case digits are both accepted.
std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

} // namespace crypto
} // namespace powgate
