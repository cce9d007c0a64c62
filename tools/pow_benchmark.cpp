/*
 * Measures nonce attempts per second and suggests a meter for a time budget
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <powgate/crypto/difficulty.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/logging/fmt_logger.hpp>
#include <powgate/pow/search.hpp>

int main(int argc, char** argv) {
    powgate::logging::FmtLogger log;

    cxxopts::Options options("powgate-bench", "Measure proof-of-work search throughput");
    // clang-format off
    options.add_options()
        ("algo",     "Hash algorithm", cxxopts::value<std::string>()->default_value("sha256"))
        ("threads",  "Worker threads", cxxopts::value<unsigned>()->default_value("1"))
        ("attempts", "Attempts to time", cxxopts::value<std::uint32_t>()->default_value("2000000"))
        ("seconds",  "Target solve time used for the meter suggestion", cxxopts::value<double>()->default_value("5"))
        ("cost",     "Cost for the success probability estimate", cxxopts::value<std::uint32_t>()->default_value("20"))
        ("payload-size", "Payload length in bytes", cxxopts::value<std::size_t>()->default_value("64"))
        ("h,help",   "Show help and exit");
    // clang-format on

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            return 0;
        }

        const auto algo = result["algo"].as<std::string>();
        const auto attempts = result["attempts"].as<std::uint32_t>();
        const auto seconds = result["seconds"].as<double>();
        const auto cost = result["cost"].as<std::uint32_t>();

        auto hasher = powgate::crypto::make_hasher(algo);
        std::string payload(result["payload-size"].as<std::size_t>(), 'x');

        powgate::pow::SearchOptions opts;
        opts.threads = result["threads"].as<unsigned>();

        // A cost no digest can meet keeps every worker busy for its whole share
        powgate::pow::Searcher searcher(*hasher, opts);
        auto outcome = searcher.run(payload, std::numeric_limits<std::uint32_t>::max(), attempts);

        const double rate = outcome.attempts_per_second();
        const auto meter = powgate::crypto::meter_for(rate, seconds);

        fmt::print("algo      : {}\n", hasher->name());
        fmt::print("threads   : {}\n", opts.threads);
        fmt::print("attempts  : {} in {:.3f}s\n", outcome.attempts,
                   std::chrono::duration<double>(outcome.elapsed).count());
        fmt::print("rate      : {:.0f} attempts/s\n", rate);
        fmt::print("meter     : {} for {:.1f}s\n", meter, seconds);
        fmt::print("cost {:3} : {:.0f} expected attempts, p(success within meter) = {:.4f}\n", cost,
                   powgate::crypto::expected_attempts(cost),
                   powgate::crypto::success_probability(cost, meter));
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}
