// config_file.cpp: key=value config loader and the option setters it shares with the CLI

#include "antsim/cli/cli.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#include "antsim/core/errors.hpp"

namespace antsim::cli {
namespace {

// trim helpers
std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string normalize_key(std::string_view k) {
    std::string t; t.reserve(k.size());
    for (char c : k) t.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return t;
}

std::string lower(const std::string& s) {
    std::string t; t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return t;
}

std::uint64_t to_u64(std::string_view key, const std::string& v) {
    std::uint64_t out = 0;
    const char* b = v.data();
    const char* e = b + v.size();
    auto res = std::from_chars(b, e, out);
    if (res.ec != std::errc{} || res.ptr != e) {
        throw InvalidConfiguration("--" + std::string(key) + " expects a non-negative integer, got '" + v + "'");
    }
    return out;
}

bool to_bool(std::string_view key, const std::string& s) {
    const std::string t = lower(s);
    if (t == "1" || t == "true" || t == "yes" || t == "y" || t == "on")  return true;
    if (t == "0" || t == "false" || t == "no" || t == "n" || t == "off") return false;
    throw InvalidConfiguration("--" + std::string(key) + " expects on|off, got '" + s + "'");
}

} // namespace

void apply_option(Options& o, std::string_view key_in, const std::string& value) {
    const std::string key = normalize_key(key_in);
    const std::string v = trim(value);

    if (key == "ants") {
        o.ants = static_cast<std::size_t>(to_u64("ants", v));
    } else if (key == "map") {
        o.map_path = v;
    } else if (key == "seed") {
        if (lower(v) == "auto") o.seed.reset();
        else                    o.seed = to_u64("seed", v);
    } else if (key == "max_ticks") {
        o.max_ticks = to_u64("max-ticks", v);
    } else if (key == "max_moves") {
        o.max_moves = to_u64("max-moves", v);
    } else if (key == "placement") {
        auto p = sim::parse_placement(lower(v));
        if (!p) throw InvalidConfiguration("--placement must be 'shared' or 'distinct', got '" + v + "'");
        o.placement = *p;
    } else if (key == "threads") {
        const auto t = to_u64("threads", v);
        if (t > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw InvalidConfiguration("--threads out of range: " + v);
        }
        o.threads = static_cast<int>(t);
    } else if (key == "experiments") {
        o.experiments = static_cast<std::size_t>(to_u64("experiments", v));
    } else if (key == "progress") {
        o.progress = to_bool("progress", v);
    } else if (key == "quiet") {
        o.quiet = to_bool("quiet", v);
    } else if (key == "log_level") {
        auto l = log::parse_level(v);
        if (!l) throw InvalidConfiguration("--log-level must be debug|info|warn|error|off, got '" + v + "'");
        o.log_level = *l;
    } else {
        throw InvalidConfiguration("unknown option '" + std::string(key_in) + "'");
    }
}

void load_config(const std::filesystem::path& path, Options& o) {
    std::ifstream fin(path);
    if (!fin) throw InvalidConfiguration("cannot open config file '" + path.string() + "'");

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(fin, line)) {
        ++line_no;
        // strip comments
        auto phash = line.find('#'); if (phash != std::string::npos) line = line.substr(0, phash);
        auto psemi = line.find(';'); if (psemi != std::string::npos) line = line.substr(0, psemi);
        line = trim(line);
        if (line.empty()) continue;
        auto peq = line.find('=');
        if (peq == std::string::npos) {
            throw InvalidConfiguration(path.string() + ":" + std::to_string(line_no) + ": expected key = value");
        }
        const std::string k = trim(line.substr(0, peq));
        if (normalize_key(k) == "config") {
            throw InvalidConfiguration(path.string() + ":" + std::to_string(line_no) + ": nested config is not supported");
        }
        apply_option(o, k, line.substr(peq + 1));
    }
    o.config_path = path.string();
}

void validate(const Options& o) {
    if (o.ants == 0) throw InvalidConfiguration("--ants is required and must be > 0 (config or CLI)");
    if (o.map_path.empty()) throw InvalidConfiguration("--map is required (config or CLI)");

    std::error_code ec;
    const std::filesystem::path p(o.map_path);
    if (!std::filesystem::exists(p, ec)) throw InvalidConfiguration("map file not found: " + o.map_path);
    if (!std::filesystem::is_regular_file(p, ec)) throw InvalidConfiguration("map path is not a file: " + o.map_path);

    if (o.experiments == 0) throw InvalidConfiguration("--experiments must be >= 1");
}

} // namespace antsim::cli
