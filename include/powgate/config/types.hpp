#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace powgate::config {

struct SolverConfig {
    std::string algo{"sha256"};
    std::uint32_t cost{20};
    std::uint32_t meter{10'000'000};
    unsigned threads{1};
};

enum class Command {
    None,
    Search,
    Verify
};

// Values given on the command line; unset fields fall back to file/env/defaults.
struct CliOverrides {
    std::optional<std::string> algo;
    std::optional<std::uint32_t> cost;
    std::optional<std::uint32_t> meter;
    std::optional<unsigned> threads;
};

struct ParseResult {
    Command command{Command::None};
    CliOverrides overrides;
    std::vector<std::uint8_t> payload;
    std::optional<std::string> nonce_hex;     // verify only
    std::optional<std::uint64_t> seed;        // search only
    std::string config_path{"powgate.conf"};
    bool ok{false};         // true when command and its inputs are present
    bool show_only{false};  // true if --help/--version was printed
    bool debug{false};      // true if --debug was passed on CLI
};

} // namespace powgate::config
