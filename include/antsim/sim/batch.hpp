// batch.hpp: many independent seeded runs over one map (TBB parallel_reduce)
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "antsim/core/rng.hpp"
#include "antsim/graphs/colony_graph.hpp"
#include "antsim/sim/engine.hpp"

namespace antsim::sim {

// ---------- Config ----------
struct BatchConfig {
    std::size_t   experiments{100};  // 0 -> 1
    std::uint64_t master_seed{0};
    EngineConfig  engine{};          // engine.seed is replaced per run
};

// Totals over all runs; averages are left to the caller.
struct BatchTotals {
    std::uint64_t runs{0};
    std::uint64_t ticks{0};
    std::uint64_t colonies_destroyed{0};
    std::uint64_t agents_destroyed{0};
    std::uint64_t surviving_agents{0};
    std::uint64_t tick_limited{0};     // runs stopped by max_ticks
    std::uint64_t max_ticks_seen{0};

    void add(const RunResult& r) {
        ++runs;
        ticks              += r.ticks;
        colonies_destroyed += r.colonies_destroyed();
        agents_destroyed   += r.agents_destroyed();
        surviving_agents   += r.surviving_agents;
        tick_limited       += (r.reason == Termination::TickLimit) ? 1u : 0u;
        if (r.ticks > max_ticks_seen) max_ticks_seen = r.ticks;
    }

    BatchTotals& merge(const BatchTotals& o) {
        runs               += o.runs;
        ticks              += o.ticks;
        colonies_destroyed += o.colonies_destroyed;
        agents_destroyed   += o.agents_destroyed;
        surviving_agents   += o.surviving_agents;
        tick_limited       += o.tick_limited;
        if (o.max_ticks_seen > max_ticks_seen) max_ticks_seen = o.max_ticks_seen;
        return *this;
    }

    double mean(std::uint64_t total) const noexcept {
        return runs ? static_cast<double>(total) / static_cast<double>(runs) : 0.0;
    }
};

// Seed J runs deterministically from the master seed (no RNG races).
inline std::vector<std::uint64_t> seed_runs(std::size_t J, std::uint64_t master_seed) {
    core::SplitMix64 master(master_seed);
    std::vector<std::uint64_t> seeds(J);
    for (std::size_t i = 0; i < J; ++i) seeds[i] = core::splitmix_hash(master());
    return seeds;
}

// Runs J independent simulations in parallel, each on its own copy of
// `graph`. The move phase inside each run stays serial (grain 0) since the
// runs already occupy the workers. progress(done, total) is called from
// worker threads and must be thread-safe.
inline BatchTotals run_batch(const graphs::ColonyGraph& graph, const BatchConfig& cfg_in,
                             const std::function<void(std::size_t, std::size_t)>& progress = {}) {
    const std::size_t J = (cfg_in.experiments == 0) ? 1 : cfg_in.experiments;
    const auto seeds = seed_runs(J, cfg_in.master_seed);
    std::atomic<std::size_t> done{0};

    return tbb::parallel_reduce(
        tbb::blocked_range<std::size_t>(0, J),
        BatchTotals{},
        [&](const tbb::blocked_range<std::size_t>& r, BatchTotals acc) {
            for (std::size_t j = r.begin(); j != r.end(); ++j) {
                EngineConfig ecfg = cfg_in.engine;
                ecfg.seed = seeds[j];
                ecfg.parallel_grain = 0;
                Engine engine(graph, ecfg);
                acc.add(engine.run());
                const std::size_t now = done.fetch_add(1, std::memory_order_relaxed) + 1;
                if (progress) progress(now, J);
            }
            return acc;
        },
        [](BatchTotals a, const BatchTotals& b) { return a.merge(b); });
}

} // namespace antsim::sim
