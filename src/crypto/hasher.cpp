/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/crypto/hasher.hpp"

#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace powgate {
namespace crypto {

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const EVP_MD* evp_md_for(EvpHasher::Algorithm algorithm) {
    switch (algorithm) {
        case EvpHasher::Algorithm::SHA256:
            return EVP_sha256();
        case EvpHasher::Algorithm::SHA3_256:
            return EVP_sha3_256();
        case EvpHasher::Algorithm::BLAKE2S_256:
            return EVP_blake2s256();
    }
    throw std::invalid_argument("Unknown hash algorithm");
}

EvpHasher::Algorithm parse_algorithm(const std::string& name) {
    if (name == "sha256") return EvpHasher::Algorithm::SHA256;
    if (name == "sha3-256") return EvpHasher::Algorithm::SHA3_256;
    if (name == "blake2s256") return EvpHasher::Algorithm::BLAKE2S_256;
    throw std::invalid_argument(fmt::format("Unsupported hash algorithm '{}'", name));
}

} // namespace

EvpHasher::EvpHasher(Algorithm algorithm) : algorithm_(algorithm) {
    const EVP_MD* md = evp_md_for(algorithm_);
    if (!md) {
        throw std::invalid_argument(
            fmt::format("Hash algorithm '{}' is not available in this OpenSSL build", name()));
    }
    if (EVP_MD_size(md) != static_cast<int>(kDigestSize)) {
        throw std::invalid_argument(fmt::format(
            "Hash algorithm '{}' produces {} bytes, expected {}", name(), EVP_MD_size(md), kDigestSize));
    }
}

EvpHasher::EvpHasher(const std::string& algorithm) : EvpHasher(parse_algorithm(algorithm)) {}

std::string EvpHasher::algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::SHA256:
            return "sha256";
        case Algorithm::SHA3_256:
            return "sha3-256";
        case Algorithm::BLAKE2S_256:
            return "blake2s256";
    }
    return "unknown";
}

std::string EvpHasher::name() const {
    return algorithm_name(algorithm_);
}

Digest EvpHasher::digest(std::initializer_list<ByteView> segments) const {
    EvpContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx.get(), evp_md_for(algorithm_), nullptr) != 1) {
        throw std::runtime_error(fmt::format("Failed to initialize {}", name()));
    }

    for (const ByteView& segment : segments) {
        if (segment.empty()) continue;
        if (EVP_DigestUpdate(ctx.get(), segment.data(), segment.size()) != 1) {
            throw std::runtime_error(fmt::format("Failed to update {}", name()));
        }
    }

    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != kDigestSize) {
        throw std::runtime_error(fmt::format("Failed to finalize {}", name()));
    }
    return out;
}

const std::vector<std::string>& supported_algorithms() {
    static const std::vector<std::string> names = {
        EvpHasher::algorithm_name(EvpHasher::Algorithm::SHA256),
        EvpHasher::algorithm_name(EvpHasher::Algorithm::SHA3_256),
        EvpHasher::algorithm_name(EvpHasher::Algorithm::BLAKE2S_256),
    };
    return names;
}

bool is_supported_algorithm(const std::string& name) {
    for (const auto& n : supported_algorithms()) {
        if (n == name) return true;
    }
    return false;
}

std::unique_ptr<Hasher> make_hasher(const std::string& name) {
    return std::make_unique<EvpHasher>(name);
}

const Hasher& default_hasher() {
    static const EvpHasher sha256(EvpHasher::Algorithm::SHA256);
    return sha256;
}

} // namespace crypto
} // namespace powgate
