// cli.hpp: Command-line parsing interface (cxxopts) and config-file defaults
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "antsim/core/config.hpp"
#include "antsim/core/log.hpp"
#include "antsim/sim/placement.hpp"

namespace antsim::cli {

struct Options {
    // Required (from config or CLI)
    std::size_t ants = 0;
    std::string map_path;

    // Master seed; nullopt => random ("auto")
    std::optional<std::uint64_t> seed;

    // Run bounds; 0 => no cap
    std::uint64_t max_ticks = core::config::default_max_ticks;
    std::uint64_t max_moves = core::config::default_max_moves;

    sim::Placement placement = sim::Placement::Shared;

    // 0 => TBB/OpenMP default
    int threads = 0;

    // >1 switches to batch mode
    std::size_t experiments = 1;
    bool progress = true;

    bool quiet = false;
    log::Level log_level = log::Level::Info;

    std::string config_path;
};

// Parse CLI arguments. A --config file is applied first and the remaining
// command-line options override it. Sets want_help/help_text for --help.
// Throws InvalidConfiguration for unknown options or unusable values.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

// Applies `key = value` lines from a config file onto `opt`. Keys are the
// long option names ('-' or '_'), case-insensitive; '#' and ';' start
// comments anywhere on a line, so values cannot contain either character
// (`map = maps/run#2.txt` reads as `maps/run`). Throws InvalidConfiguration
// for unreadable files, unknown keys or bad values.
void load_config(const std::filesystem::path& path, Options& opt);

// Applies a single option by name; shared by the config file and the CLI.
void apply_option(Options& opt, std::string_view key, const std::string& value);

// Required fields present, map file exists, ranges sane.
void validate(const Options& opt);

} // namespace antsim::cli
