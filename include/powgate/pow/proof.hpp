/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>

#include <powgate/crypto/bytes.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/pow/nonce.hpp>

namespace powgate {
namespace pow {

/**
 * Digest of nonce ‖ payload: the nonce bytes immediately followed by the
 * payload, with no separator or length prefix. Search and verification
 * both go through this function.
 */
crypto::Digest proof_digest(const crypto::Hasher& hasher, const Nonce& nonce, crypto::ByteView payload);

/**
 * Check a proof of work.
 * @param payload Bytes the proof was computed for
 * @param nonce   Caller-supplied nonce
 * @param cost    Required leading zero bits
 * @return true if the digest of nonce ‖ payload has at least `cost` leading zero bits
 */
bool verify(const crypto::Hasher& hasher, crypto::ByteView payload, const Nonce& nonce, std::uint32_t cost);

// SHA-256 variant
bool verify(crypto::ByteView payload, const Nonce& nonce, std::uint32_t cost);

} // namespace pow
} // namespace powgate
