/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/pow/nonce.hpp"
#include "powgate/crypto/hex.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace powgate {
namespace pow {

namespace {

void append_words(std::vector<std::uint32_t>& words, std::uint64_t value) {
    words.push_back(static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
    words.push_back(static_cast<std::uint32_t>(value >> 32));
}

std::mt19937_64 seeded_engine(const std::vector<std::uint32_t>& words) {
    std::seed_seq seq(words.begin(), words.end());
    return std::mt19937_64(seq);
}

std::vector<std::uint32_t> entropy_words(std::uint64_t stream_id) {
    std::array<std::uint32_t, 8> entropy{};
    if (RAND_bytes(reinterpret_cast<unsigned char*>(entropy.data()),
                   static_cast<int>(sizeof(entropy))) != 1) {
        throw std::runtime_error("Failed to gather entropy for nonce source");
    }
    std::vector<std::uint32_t> words(entropy.begin(), entropy.end());
    append_words(words, stream_id);
    return words;
}

std::vector<std::uint32_t> fixed_words(std::uint64_t seed, std::uint64_t stream_id) {
    std::vector<std::uint32_t> words;
    append_words(words, seed);
    append_words(words, stream_id);
    return words;
}

} // namespace

std::string nonce_to_hex(const Nonce& nonce) {
    return crypto::bytes_to_hex(crypto::ByteView(nonce.data(), nonce.size()));
}

std::optional<Nonce> nonce_from_hex(const std::string& hex) {
    if (hex.size() != 2 * kNonceSize) return std::nullopt;
    auto bytes = crypto::hex_to_bytes(hex);
    if (!bytes) return std::nullopt;

    Nonce nonce{};
    std::copy(bytes->begin(), bytes->end(), nonce.begin());
    return nonce;
}

NonceSource::NonceSource(std::uint64_t stream_id)
    : engine_(seeded_engine(entropy_words(stream_id))) {}

NonceSource::NonceSource(std::uint64_t seed, std::uint64_t stream_id)
    : engine_(seeded_engine(fixed_words(seed, stream_id))) {}

void NonceSource::fill(Nonce& nonce) {
    static_assert(kNonceSize % 8 == 0, "nonce is filled 64 bits at a time");
    for (std::size_t off = 0; off < kNonceSize; off += 8) {
        std::uint64_t word = engine_();
        for (std::size_t i = 0; i < 8; ++i) {
            nonce[off + i] = static_cast<std::uint8_t>(word >> (8 * i));
        }
    }
}

Nonce NonceSource::next() {
    Nonce nonce{};
    fill(nonce);
    return nonce;
}

} // namespace pow
} // namespace powgate
