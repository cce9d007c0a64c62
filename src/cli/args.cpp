#include <powgate/cli/args.hpp>

#include <cstdint>
#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <powgate/crypto/hex.hpp>

#ifndef POWGATE_VERSION
#define POWGATE_VERSION "0.0.0"
#endif

namespace powgate::cli {

powgate::config::ParseResult parse(int argc, char** argv, powgate::logging::Logger& log) {
    using powgate::config::Command;

    powgate::config::ParseResult pr;
    cxxopts::Options options("powgate", "Proof-of-work nonce search and verification");
    options.positional_help("<search|verify>");
    // clang-format off
    options.add_options()
        ("command",     "search or verify", cxxopts::value<std::string>())
        ("payload",     "Payload as text", cxxopts::value<std::string>())
        ("payload-hex", "Payload as hex bytes", cxxopts::value<std::string>())
        ("nonce",       "Nonce to verify (32 hex chars)", cxxopts::value<std::string>())
        ("cost",        "Required leading zero bits (0-256)", cxxopts::value<std::uint32_t>())
        ("meter",       "Maximum number of search attempts", cxxopts::value<std::uint32_t>())
        ("threads",     "Search worker threads", cxxopts::value<unsigned>())
        ("algo",        "Hash algorithm (sha256, sha3-256, blake2s256)", cxxopts::value<std::string>())
        ("seed",        "Fixed nonce seed for reproducible searches", cxxopts::value<std::uint64_t>())
        ("config",      "Path to config file", cxxopts::value<std::string>()->default_value("powgate.conf"))
        ("d,debug",     "Enable debug logging")
        ("v,version",   "Show version and exit")
        ("h,help",      "Show help and exit");
    // clang-format on
    options.parse_positional({"command"});

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("powgate v{}", POWGATE_VERSION));
            pr.show_only = true;
            return pr;
        }

        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        if (result.count("algo"))    pr.overrides.algo    = result["algo"].as<std::string>();
        if (result.count("cost"))    pr.overrides.cost    = result["cost"].as<std::uint32_t>();
        if (result.count("meter"))   pr.overrides.meter   = result["meter"].as<std::uint32_t>();
        if (result.count("threads")) pr.overrides.threads = result["threads"].as<unsigned>();
        if (result.count("seed"))    pr.seed              = result["seed"].as<std::uint64_t>();
        if (result.count("nonce"))   pr.nonce_hex         = result["nonce"].as<std::string>();

        if (!result.count("command")) {
            log.error(fmt::format("Missing command\n\n{}", options.help()));
            return pr;
        }
        const auto command = result["command"].as<std::string>();
        if (command == "search") pr.command = Command::Search;
        else if (command == "verify") pr.command = Command::Verify;
        else {
            log.error(fmt::format("Unknown command '{}'\n\n{}", command, options.help()));
            return pr;
        }

        const bool has_text = result.count("payload") > 0;
        const bool has_hex = result.count("payload-hex") > 0;
        if (has_text == has_hex) {
            log.error("Exactly one of --payload or --payload-hex is required");
            return pr;
        }
        if (has_text) {
            const auto text = result["payload"].as<std::string>();
            pr.payload.assign(text.begin(), text.end());
        } else {
            auto bytes = powgate::crypto::hex_to_bytes(result["payload-hex"].as<std::string>());
            if (!bytes) {
                log.error("--payload-hex is not valid hex");
                return pr;
            }
            pr.payload = std::move(*bytes);
        }

        if (pr.command == Command::Verify && !pr.nonce_hex) {
            log.error("verify requires --nonce");
            return pr;
        }
        pr.ok = true;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace powgate::cli
