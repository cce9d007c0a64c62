/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace powgate {
namespace pow {

// Part of the proof format: changing it invalidates every issued proof.
constexpr std::size_t kNonceSize = 16;

using Nonce = std::array<std::uint8_t, kNonceSize>;

std::string nonce_to_hex(const Nonce& nonce);

// Expects exactly 2 * kNonceSize hex characters
std::optional<Nonce> nonce_from_hex(const std::string& hex);

/**
 * Uniform nonce generator for one search worker.
 *
 * Not a cryptographic generator: nonces only need to be spread evenly over
 * the nonce space. Each worker uses its own stream id so that workers seeded
 * together never walk the same sequence.
 */
class NonceSource {
public:
    // Seeds from OpenSSL RAND_bytes. Throws std::runtime_error if no entropy is available.
    explicit NonceSource(std::uint64_t stream_id = 0);

    // Reproducible sequence for a given (seed, stream_id)
    NonceSource(std::uint64_t seed, std::uint64_t stream_id);

    void fill(Nonce& nonce);
    Nonce next();

private:
    std::mt19937_64 engine_;
};

} // namespace pow
} // namespace powgate
