/*
 * Unit tests for config file loading and environment overrides
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powgate/config/loader.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace powgate::config;

namespace {

struct TempFile {
    explicit TempFile(const std::string& name, const std::string& text)
        : path((std::filesystem::temp_directory_path() / name).string()) {
        std::ofstream out(path);
        out << text;
    }
    ~TempFile() { std::remove(path.c_str()); }
    std::string path;
};

struct EnvVar {
    EnvVar(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~EnvVar() { ::unsetenv(name_); }
    const char* name_;
};

} // namespace

TEST_SUITE("Config Loader") {
    TEST_CASE("missing file keeps defaults") {
        SolverConfig cfg;
        auto errs = load_from_file(cfg, "/nonexistent/powgate.conf");
        CHECK(errs.empty());
        CHECK(cfg.algo == "sha256");
        CHECK(cfg.cost == 20);
        CHECK(cfg.meter == 10'000'000u);
        CHECK(cfg.threads == 1);
    }

    TEST_CASE("JSON file") {
        TempFile f("powgate_test_json.conf",
                   R"({"algo": "sha3-256", "cost": 22, "meter": 5000000, "threads": 4})");
        SolverConfig cfg;
        auto errs = load_from_file(cfg, f.path);
        CHECK(errs.empty());
        CHECK(cfg.algo == "sha3-256");
        CHECK(cfg.cost == 22);
        CHECK(cfg.meter == 5'000'000u);
        CHECK(cfg.threads == 4);
    }

    TEST_CASE("JSON type errors leave cfg untouched") {
        TempFile f("powgate_test_bad_json.conf", R"({"algo": 5, "cost": -1, "meter": "lots"})");
        SolverConfig cfg;
        auto errs = load_from_file(cfg, f.path);
        CHECK(errs.size() == 3);
        CHECK(cfg.algo == "sha256");
        CHECK(cfg.cost == 20);
    }

    TEST_CASE("malformed JSON is reported") {
        TempFile f("powgate_test_broken.conf", "{ \"cost\": ");
        SolverConfig cfg;
        auto errs = load_from_file(cfg, f.path);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("Failed to read") != std::string::npos);
    }

    TEST_CASE("key=value file") {
        TempFile f("powgate_test_kv.conf",
                   "# proof settings\nalgo=blake2s256\ncost=18\r\nmeter=123456\nthreads=2\nunknown=1\n");
        SolverConfig cfg;
        auto errs = load_from_file(cfg, f.path);
        CHECK(errs.empty());
        CHECK(cfg.algo == "blake2s256");
        CHECK(cfg.cost == 18);
        CHECK(cfg.meter == 123456u);
        CHECK(cfg.threads == 2);
    }

    TEST_CASE("file values are validated") {
        TempFile f("powgate_test_invalid.conf", "algo=md5\ncost=300\n");
        SolverConfig cfg;
        auto errs = load_from_file(cfg, f.path);
        CHECK(errs.size() == 2);
        CHECK(cfg.algo == "sha256");
    }

    TEST_CASE("environment overrides") {
        EnvVar algo("POWGATE_ALGO", "sha3-256");
        EnvVar cost("POWGATE_COST", "24");
        EnvVar threads("POWGATE_THREADS", "8");
        SolverConfig cfg;
        CHECK(apply_env_overrides(cfg).empty());
        CHECK(cfg.algo == "sha3-256");
        CHECK(cfg.cost == 24);
        CHECK(cfg.threads == 8);
        CHECK(cfg.meter == 10'000'000u);
    }

    TEST_CASE("bad environment numbers are reported") {
        EnvVar meter("POWGATE_METER", "ten");
        SolverConfig cfg;
        auto errs = apply_env_overrides(cfg);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("POWGATE_METER") != std::string::npos);
        CHECK(cfg.meter == 10'000'000u);
    }

    TEST_CASE("command line wins") {
        SolverConfig cfg;
        CliOverrides cli;
        cli.cost = 5;
        cli.algo = "blake2s256";
        apply_cli_overrides(cfg, cli);
        CHECK(cfg.cost == 5);
        CHECK(cfg.algo == "blake2s256");
        CHECK(cfg.meter == 10'000'000u);
        CHECK(cfg.threads == 1);
    }
}
