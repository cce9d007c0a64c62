/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/pow/proof.hpp"
#include "powgate/crypto/difficulty.hpp"

namespace powgate {
namespace pow {

crypto::Digest proof_digest(const crypto::Hasher& hasher, const Nonce& nonce, crypto::ByteView payload) {
    return hasher.digest({crypto::ByteView(nonce.data(), nonce.size()), payload});
}

bool verify(const crypto::Hasher& hasher, crypto::ByteView payload, const Nonce& nonce, std::uint32_t cost) {
    return crypto::meets_cost(proof_digest(hasher, nonce, payload), cost);
}

bool verify(crypto::ByteView payload, const Nonce& nonce, std::uint32_t cost) {
    return verify(crypto::default_hasher(), payload, nonce, cost);
}

} // namespace pow
} // namespace powgate
