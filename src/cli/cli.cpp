// cli.cpp: Command-line parsing implementation using cxxopts

#include "antsim/cli/cli.hpp"

#include <cxxopts.hpp>
#include <string>
#include <vector>

#include "antsim/core/errors.hpp"

namespace antsim::cli {

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    cxxopts::Options desc("antsim", "Ants wander a map of colonies; two ants meeting destroy the colony.");
    desc.add_options()
        ("h,help", "Show this help")
        ("a,ants", "Number of ants (required)", cxxopts::value<std::string>())
        ("m,map", "Map file (required)", cxxopts::value<std::string>())
        ("s,seed", "Master seed, integer or 'auto' (default auto)", cxxopts::value<std::string>())
        ("max-ticks", "Stop after N ticks, 0 = never (default 100000)", cxxopts::value<std::string>())
        ("max-moves", "Moves per ant before it rests, 0 = unlimited (default 10000)", cxxopts::value<std::string>())
        ("placement", "Start placement: shared|distinct (default shared)", cxxopts::value<std::string>())
        ("threads", "Worker threads, 0 = all cores (default 0)", cxxopts::value<std::string>())
        ("e,experiments", "Independent runs; > 1 prints averages only (default 1)", cxxopts::value<std::string>())
        ("progress", "Progress bar in batch mode: on|off (default on)", cxxopts::value<std::string>())
        ("q,quiet", "Do not print destruction events")
        ("log-level", "debug|info|warn|error|off (default info)", cxxopts::value<std::string>())
        ("config", "key = value file providing defaults", cxxopts::value<std::string>())
    ;
    help_text = desc.help();

    try {
        auto result = desc.parse(argc, argv);
        if (result.count("help")) { want_help = true; return opt; }

        if (!result.unmatched().empty()) {
            throw InvalidConfiguration("unexpected argument '" + result.unmatched().front() + "'");
        }

        // Config first (so it provides defaults), then CLI overrides.
        if (result.count("config")) load_config(result["config"].as<std::string>(), opt);

        static const std::vector<std::string> keys = {
            "ants", "map", "seed", "max-ticks", "max-moves", "placement",
            "threads", "experiments", "progress", "log-level",
        };
        for (const auto& k : keys) {
            if (result.count(k)) apply_option(opt, k, result[k].as<std::string>());
        }
        if (result.count("quiet")) opt.quiet = true;
    } catch (const cxxopts::exceptions::exception& e) {
        throw InvalidConfiguration(e.what());
    }

    return opt;
}

} // namespace antsim::cli
