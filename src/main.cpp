// Main entry: load a colony map, drop ants on it and report what they destroy
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <omp.h>
#include <tbb/global_control.h>

#include "antsim/cli/cli.hpp"
#include "antsim/core/errors.hpp"
#include "antsim/core/log.hpp"
#include "antsim/core/rng.hpp"
#include "antsim/io/map_parser.hpp"
#include "antsim/io/progress.hpp"
#include "antsim/io/report.hpp"
#include "antsim/sim/batch.hpp"
#include "antsim/sim/engine.hpp"
#include "antsim/util/timing.hpp"

namespace {

// Exit codes (distinct per failure kind)
constexpr int kExitOk = 0;
constexpr int kExitInternal = 1;
constexpr int kExitConfig = 2;
constexpr int kExitMap = 3;

int run_single(antsim::graphs::ColonyGraph graph, const antsim::sim::EngineConfig& ecfg, bool quiet) {
    using namespace antsim;

    sim::Engine::EventListener on_event;
    if (!quiet) on_event = [](const sim::DestructionEvent& ev) { io::write_event(std::cout, ev); };

    sim::Engine engine(std::move(graph), ecfg, std::move(on_event));

    // Start timing after the map is loaded and the ants are placed.
    util::Stopwatch sw;
    const sim::RunResult r = engine.run();
    const double secs = sw.seconds();

    if (r.reason == sim::Termination::TickLimit) {
        log::warn("simulation stopped after " + std::to_string(r.ticks) + " ticks; ants were still moving");
    }
    io::write_summary(std::cout, r, secs);
    std::cout << "\nRemaining map:\n";
    io::write_remaining_map(std::cout, engine.graph());
    return kExitOk;
}

int run_experiments(const antsim::graphs::ColonyGraph& graph, const antsim::sim::EngineConfig& ecfg,
                    std::size_t experiments, bool show_progress) {
    using namespace antsim;

    sim::BatchConfig bcfg{ .experiments = experiments, .master_seed = ecfg.seed, .engine = ecfg };

    std::unique_ptr<io::BatchProgress> bar;
    if (show_progress) {
        bar = std::make_unique<io::BatchProgress>(experiments);
        bar->start();
    }

    util::Stopwatch sw;
    const auto totals = sim::run_batch(graph, bcfg, [&](std::size_t done, std::size_t) {
        if (bar) bar->tick(done);
    });
    const double secs = sw.seconds();
    if (bar) bar->stop();

    io::write_batch_summary(std::cout, totals, secs);
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    using namespace antsim;

    cli::Options opt;
    try {
        bool want_help = false; std::string help_text;
        opt = cli::parse_args(argc, argv, want_help, help_text);
        if (want_help) { std::cout << help_text; return kExitOk; }
        cli::validate(opt);
    } catch (const InvalidConfiguration& e) {
        log::error(e.what());
        return kExitConfig;
    }
    log::set_level(opt.log_level);

    // Threads: cap both the TBB move phase and the OpenMP sweep.
    std::optional<tbb::global_control> tbb_limit;
    if (opt.threads > 0) {
        tbb_limit.emplace(tbb::global_control::max_allowed_parallelism, static_cast<std::size_t>(opt.threads));
        omp_set_num_threads(opt.threads);
    }

    const std::uint64_t seed = opt.seed ? *opt.seed : core::make_random_seed();
    log::info("seed " + std::to_string(seed) + (opt.seed ? "" : " (auto)"));

    try {
        graphs::ColonyGraph graph = io::load_map_file(opt.map_path);

        sim::EngineConfig ecfg;
        ecfg.agents    = opt.ants;
        ecfg.seed      = seed;
        ecfg.max_ticks = opt.max_ticks;
        ecfg.max_moves = opt.max_moves;
        ecfg.placement = opt.placement;

        if (opt.experiments > 1) return run_experiments(graph, ecfg, opt.experiments, opt.progress);
        return run_single(std::move(graph), ecfg, opt.quiet);
    } catch (const MapParseError& e) {
        log::error("map " + opt.map_path + ": " + e.what());
        return kExitMap;
    } catch (const InvalidConfiguration& e) {
        log::error(e.what());
        return kExitConfig;
    } catch (const UnknownColony& e) {
        log::error(std::string("internal error: map loader referenced ") + e.what());
        return kExitInternal;
    } catch (const std::exception& e) {
        log::error(std::string("internal error: ") + e.what());
        return kExitInternal;
    }
}
