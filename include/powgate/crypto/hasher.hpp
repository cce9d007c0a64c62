/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include <powgate/crypto/bytes.hpp>

namespace powgate::crypto {

constexpr std::size_t kDigestSize = 32;
constexpr std::uint32_t kDigestBits = kDigestSize * 8;

using Digest = std::array<std::uint8_t, kDigestSize>;

/**
 * Cryptographic hash primitive with a fixed 32-byte output.
 *
 * The segments are hashed as if they were concatenated, with nothing
 * inserted between them. Implementations must be safe to call from
 * several threads at once.
 */
class Hasher {
public:
    virtual ~Hasher() = default;

    virtual Digest digest(std::initializer_list<ByteView> segments) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Hasher backed by an OpenSSL EVP message digest.
 * Throws std::invalid_argument for an unknown algorithm or one whose
 * output is not kDigestSize bytes.
 */
class EvpHasher : public Hasher {
public:
    enum class Algorithm {
        SHA256,
        SHA3_256,
        BLAKE2S_256
    };

    explicit EvpHasher(Algorithm algorithm = Algorithm::SHA256);
    explicit EvpHasher(const std::string& algorithm);

    Digest digest(std::initializer_list<ByteView> segments) const override;
    std::string name() const override;

    static std::string algorithm_name(Algorithm algorithm);

private:
    Algorithm algorithm_;
};

// Algorithm names accepted by make_hasher, default first.
const std::vector<std::string>& supported_algorithms();

bool is_supported_algorithm(const std::string& name);

std::unique_ptr<Hasher> make_hasher(const std::string& name = "sha256");

// Shared SHA-256 instance used when no hasher is given.
const Hasher& default_hasher();

} // namespace powgate::crypto
