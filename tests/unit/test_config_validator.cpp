/*
 * Unit tests for config validation (numbers, cost, threads, algo)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powgate/config/loader.hpp>
#include <powgate/config/validator.hpp>

using namespace powgate::config;

TEST_SUITE("Config Validator") {
    TEST_CASE("parse_u32 - valid numbers") {
        std::string err;
        std::uint32_t v = 0;

        CHECK(parse_u32("0", v, err));
        CHECK(v == 0);
        CHECK(parse_u32("22", v, err));
        CHECK(v == 22);
        CHECK(parse_u32("4294967295", v, err));
        CHECK(v == 4294967295u);
        CHECK(parse_u32("0010", v, err));
        CHECK(v == 10);
    }

    TEST_CASE("parse_u32 - invalid numbers") {
        std::string err;
        std::uint32_t v = 7;

        CHECK_FALSE(parse_u32("", v, err));
        CHECK(err.find("empty") != std::string::npos);

        CHECK_FALSE(parse_u32("-1", v, err));
        CHECK(err.find("digits") != std::string::npos);

        CHECK_FALSE(parse_u32("12a", v, err));
        CHECK_FALSE(parse_u32(" 12", v, err));

        CHECK_FALSE(parse_u32("4294967296", v, err));
        CHECK(err.find("range") != std::string::npos);
        CHECK_FALSE(parse_u32("99999999999999999999", v, err));

        CHECK(v == 7);
    }

    TEST_CASE("is_valid_cost - digest bit length is the limit") {
        std::string err;
        CHECK(is_valid_cost(0, err));
        CHECK(is_valid_cost(22, err));
        CHECK(is_valid_cost(256, err));
        CHECK_FALSE(is_valid_cost(257, err));
        CHECK(err.find("256") != std::string::npos);
    }

    TEST_CASE("is_valid_threads - range") {
        std::string err;
        CHECK(is_valid_threads(1, err));
        CHECK(is_valid_threads(kMaxThreads, err));
        CHECK_FALSE(is_valid_threads(0, err));
        CHECK_FALSE(is_valid_threads(kMaxThreads + 1, err));
        CHECK(err.find("threads") != std::string::npos);
    }

    TEST_CASE("is_valid_algo") {
        std::string err;
        CHECK(is_valid_algo("sha256", err));
        CHECK(is_valid_algo("sha3-256", err));
        CHECK(is_valid_algo("blake2s256", err));
        CHECK_FALSE(is_valid_algo("blake3", err));
        CHECK(err.find("sha256") != std::string::npos);
    }

    TEST_CASE("validate_final - collects every error") {
        SolverConfig cfg;
        CHECK(validate_final(cfg).empty());

        cfg.algo = "md5";
        cfg.cost = 300;
        cfg.threads = 0;
        CHECK(validate_final(cfg).size() == 3);
    }
}
