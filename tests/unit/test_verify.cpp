/*
 * Unit tests for proof verification
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powgate/crypto/difficulty.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/pow/proof.hpp>
#include <powgate/pow/search.hpp>

#include <string>
#include <vector>

using namespace powgate;

namespace {

pow::Nonce seeded_proof(const std::string& payload, std::uint32_t cost) {
    pow::SearchOptions opts;
    opts.seed = 99;
    pow::Searcher searcher(crypto::default_hasher(), opts);
    auto outcome = searcher.run(payload, cost, 50'000'000);
    REQUIRE(outcome.found());
    return *outcome.nonce;
}

} // namespace

TEST_SUITE("Verify") {
    TEST_CASE("zero cost accepts every nonce") {
        pow::NonceSource src(5, 0);
        for (int i = 0; i < 32; ++i) {
            CHECK(pow::verify("any payload", src.next(), 0));
        }
        CHECK(pow::verify("", pow::Nonce{}, 0));
    }

    TEST_CASE("verify is deterministic") {
        const std::string payload = "deterministic";
        const auto nonce = seeded_proof(payload, 12);
        for (int i = 0; i < 10; ++i) {
            CHECK(pow::verify(payload, nonce, 12));
        }
        const bool at13 = pow::verify(payload, nonce, 13);
        for (int i = 0; i < 10; ++i) {
            CHECK(pow::verify(payload, nonce, 13) == at13);
        }
    }

    TEST_CASE("lower costs are implied by higher ones") {
        const std::string payload = "monotone";
        const auto nonce = seeded_proof(payload, 16);
        const auto digest = pow::proof_digest(crypto::default_hasher(), nonce, payload);
        const auto zeros = crypto::leading_zero_bits(digest.data(), digest.size());
        REQUIRE(zeros >= 16);
        for (std::uint32_t c = 0; c <= zeros; ++c) {
            CHECK(pow::verify(payload, nonce, c));
        }
        CHECK_FALSE(pow::verify(payload, nonce, zeros + 1));
    }

    TEST_CASE("cost above the digest size is never met") {
        CHECK_FALSE(pow::verify("x", pow::Nonce{}, crypto::kDigestBits + 1));
    }

    TEST_CASE("verify matches the digest predicate with every algorithm") {
        pow::Nonce nonce{};
        nonce[3] = 0x42;
        for (const auto& name : crypto::supported_algorithms()) {
            auto h = crypto::make_hasher(name);
            const auto d = pow::proof_digest(*h, nonce, "predicate");
            const auto zeros = crypto::leading_zero_bits(d.data(), d.size());
            CHECK(pow::verify(*h, "predicate", nonce, zeros));
            CHECK_FALSE(pow::verify(*h, "predicate", nonce, zeros + 1));
        }
    }

    TEST_CASE("single byte changes break the proof") {
        const std::string payload = "sensitive payload";
        const auto nonce = seeded_proof(payload, 16);
        const auto digest = pow::proof_digest(crypto::default_hasher(), nonce, payload);

        int still_valid = 0;
        int variants = 0;
        for (std::size_t i = 0; i < payload.size(); ++i) {
            std::string changed = payload;
            changed[i] ^= 0x01;
            CHECK(pow::proof_digest(crypto::default_hasher(), nonce, changed) != digest);
            still_valid += pow::verify(changed, nonce, 16) ? 1 : 0;
            ++variants;
        }
        for (std::size_t i = 0; i < nonce.size(); ++i) {
            pow::Nonce changed = nonce;
            changed[i] ^= 0x80;
            CHECK(pow::proof_digest(crypto::default_hasher(), changed, payload) != digest);
            still_valid += pow::verify(payload, changed, 16) ? 1 : 0;
            ++variants;
        }
        CHECK(still_valid < variants);
    }

    TEST_CASE("proof is bound to its algorithm") {
        const std::string payload = "bound";
        const auto nonce = seeded_proof(payload, 16);
        crypto::EvpHasher sha3("sha3-256");
        crypto::EvpHasher blake("blake2s256");
        // A 16-bit proof carries over by chance with probability 2^-16 per algorithm
        CHECK_FALSE((pow::verify(sha3, payload, nonce, 16) && pow::verify(blake, payload, nonce, 16)));
    }
}
