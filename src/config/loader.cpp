#include <powgate/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <powgate/config/validator.hpp>

namespace powgate::config {

static void set_number(const std::string& key, const std::string& text, std::uint32_t& out,
                       std::vector<std::string>& errs) {
    std::uint32_t v = 0;
    std::string e;
    if (!parse_u32(text, v, e)) {
        errs.push_back(fmt::format("'{}': {}", key, e));
        return;
    }
    out = v;
}

static std::vector<std::string> load_key_value(SolverConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (key == "algo") cfg.algo = val;
        else if (key == "cost") set_number(key, val, cfg.cost, errs);
        else if (key == "meter") set_number(key, val, cfg.meter, errs);
        else if (key == "threads") {
            std::uint32_t t = cfg.threads;
            set_number(key, val, t, errs);
            cfg.threads = t;
        }
    }
    return errs;
}

std::vector<std::string> load_from_file(SolverConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    SolverConfig next = cfg;
    if (text[first_non_space] == '{') {
        try {
            nlohmann::json j = nlohmann::json::parse(text);
            if (j.contains("algo")) {
                if (j.at("algo").is_string()) next.algo = j.at("algo").get<std::string>();
                else errs.push_back("'algo' must be a string");
            }
            auto read_u32 = [&](const char* key, std::uint32_t& out) {
                if (!j.contains(key)) return;
                const auto& v = j.at(key);
                if (!v.is_number_unsigned() || v.get<std::uint64_t>() > 0xFFFFFFFFull) {
                    errs.push_back(fmt::format("'{}' must be an unsigned 32-bit integer", key));
                    return;
                }
                out = v.get<std::uint32_t>();
            };
            read_u32("cost", next.cost);
            read_u32("meter", next.meter);
            std::uint32_t threads = next.threads;
            read_u32("threads", threads);
            next.threads = threads;
        } catch (const nlohmann::json::exception& ex) {
            errs.push_back(fmt::format("Failed to read {}: {}", path, ex.what()));
        }
    } else {
        errs = load_key_value(next, text);
    }

    if (errs.empty()) {
        std::string e;
        if (!is_valid_algo(next.algo, e)) errs.push_back(e);
        if (!is_valid_cost(next.cost, e)) errs.push_back(e);
        if (!is_valid_threads(next.threads, e)) errs.push_back(e);
    }
    if (errs.empty()) cfg = next;
    return errs;
}

std::vector<std::string> apply_env_overrides(SolverConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("POWGATE_ALGO")) cfg.algo = v;
    if (const char* v = std::getenv("POWGATE_COST")) set_number("POWGATE_COST", v, cfg.cost, errs);
    if (const char* v = std::getenv("POWGATE_METER")) set_number("POWGATE_METER", v, cfg.meter, errs);
    if (const char* v = std::getenv("POWGATE_THREADS")) {
        std::uint32_t t = cfg.threads;
        set_number("POWGATE_THREADS", v, t, errs);
        cfg.threads = t;
    }
    return errs;
}

void apply_cli_overrides(SolverConfig& cfg, const CliOverrides& cli) {
    if (cli.algo) cfg.algo = *cli.algo;
    if (cli.cost) cfg.cost = *cli.cost;
    if (cli.meter) cfg.meter = *cli.meter;
    if (cli.threads) cfg.threads = *cli.threads;
}

std::vector<std::string> validate_final(const SolverConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_valid_algo(cfg.algo, e)) errs.push_back(e);
    if (!is_valid_cost(cfg.cost, e)) errs.push_back(e);
    if (!is_valid_threads(cfg.threads, e)) errs.push_back(e);
    return errs;
}

} // namespace powgate::config
