// tick.hpp: the phases of one simulation tick over ColonyGraphLike/RosterLike state
#pragma once
/*
A tick is:
  1. plan_moves      (parallel scatter) each mover draws a destination from
                     its own (seed, tick, agent) stream. Reads the graph and
                     the roster, writes only its own slot.
  2. catch_crossings (parallel) two agents swapping colonies over opposite
                     tunnels meet: the higher id is caught before leaving and
                     both end on the lower id's destination.
  3. apply_moves     (serial) relocations are written to the roster.
  4. find_collisions (serial) colonies holding 2+ agents in the post-move
     + destroy_collisions       snapshot are destroyed with their occupants.
  5. any_agent_can_move (OpenMP reduction) termination sweep.
Phases 1 and 2 return only after every task has finished, which is the
barrier between reading the graph and mutating it.
*/

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <omp.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "antsim/core/config.hpp"
#include "antsim/core/rng.hpp"
#include "antsim/sim/graph_concepts.hpp"

namespace antsim::sim {

struct TickParams {
    std::uint64_t seed{0};
    core::tick_t  tick{0};
    std::uint64_t max_moves{0};       // 0 -> unlimited
    std::size_t   grain{core::config::default_parallel_grain};
};

// Per-agent scratch reused across ticks (indexed by agent id).
struct MoveScratch {
    std::vector<colony_id_t>   dest;    // kNoColony -> stays
    std::vector<unsigned char> caught;

    void prepare(std::size_t agents) {
        dest.assign(agents, core::kNoColony);
        caught.assign(agents, 0);
    }
};

struct Collision {
    colony_id_t             colony;
    std::vector<agent_id_t> agents;   // ascending
};

// Runs body(begin, end) over [0, n): through TBB when n reaches the grain,
// inline otherwise. Returns after all chunks completed.
template <class Body>
inline void for_range(std::size_t n, std::size_t grain, Body&& body) {
    if (n == 0) return;
    if (grain == 0 || n < grain) { body(std::size_t{0}, n); return; }
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, n, std::max<std::size_t>(1, grain / 4)),
                      [&](const tbb::blocked_range<std::size_t>& r) { body(r.begin(), r.end()); });
}

template <class G, class R>
    requires ColonyGraphLike<G> && RosterLike<R>
inline bool can_move(const G& graph, const R& roster, agent_id_t agent, std::uint64_t max_moves) {
    if (max_moves != 0 && roster.moves(agent) >= max_moves) return false;
    const colony_id_t c = roster.position(agent);
    return c != core::kNoColony && !graph.neighbors(c).empty();
}

// Uniform choice among the outgoing edges of `from`; kNoColony for dead ends.
template <class G>
    requires ColonyGraphLike<G>
inline colony_id_t pick_destination(const G& graph, colony_id_t from, const TickParams& p, agent_id_t agent) {
    const auto edges = graph.neighbors(from);
    if (edges.empty()) return core::kNoColony;
    if (edges.size() == 1) return edges.front().target;
    core::SplitMix64 rng(core::stream_seed(p.seed, p.tick, agent));
    return edges[static_cast<std::size_t>(core::uniform_bounded(rng, edges.size()))].target;
}

template <class G, class R>
    requires ColonyGraphLike<G> && RosterLike<R>
inline void plan_moves(const G& graph, const R& roster, std::span<const agent_id_t> movers,
                       const TickParams& p, MoveScratch& s) {
    s.prepare(roster.id_capacity());
    for_range(movers.size(), p.grain, [&](std::size_t b, std::size_t e) {
        for (std::size_t i = b; i < e; ++i) {
            const agent_id_t a = movers[i];
            if (!can_move(graph, roster, a, p.max_moves)) continue;
            s.dest[a] = pick_destination(graph, roster.position(a), p, a);
        }
    });
}

// Tick-start occupancy has at most one agent per colony, so the agent a
// could swap with is the single occupant of its destination.
template <class R>
    requires RosterLike<R>
inline void catch_crossings(const R& roster, std::span<const agent_id_t> movers,
                            std::size_t grain, MoveScratch& s) {
    for_range(movers.size(), grain, [&](std::size_t b, std::size_t e) {
        for (std::size_t i = b; i < e; ++i) {
            const agent_id_t a = movers[i];
            const colony_id_t to = s.dest[a];
            const colony_id_t from = roster.position(a);
            if (to == core::kNoColony || to == from) continue;
            for (agent_id_t other : roster.occupants(to)) {
                if (other < a && s.dest[other] == from) { s.caught[a] = 1; break; }
            }
        }
    });
}

// Returns the number of agents that changed colony.
template <class R>
    requires RosterLike<R>
inline std::size_t apply_moves(R& roster, std::span<const agent_id_t> movers, const MoveScratch& s) {
    std::size_t moved = 0;
    for (agent_id_t a : movers) {
        const colony_id_t to = s.dest[a];
        if (to == core::kNoColony || s.caught[a]) continue;
        roster.record_move(a);
        if (to == roster.position(a)) continue; // self-loop tunnel
        roster.place(a, to);
        ++moved;
    }
    return moved;
}

// Colonies holding 2+ of `agents` right now, ascending by colony id.
template <class R>
    requires RosterLike<R>
inline std::vector<Collision> find_collisions(const R& roster, std::span<const agent_id_t> agents) {
    std::vector<colony_id_t> crowded;
    for (agent_id_t a : agents) {
        const colony_id_t c = roster.position(a);
        if (c != core::kNoColony && roster.occupants(c).size() >= 2) crowded.push_back(c);
    }
    std::sort(crowded.begin(), crowded.end());
    crowded.erase(std::unique(crowded.begin(), crowded.end()), crowded.end());

    std::vector<Collision> out;
    out.reserve(crowded.size());
    for (colony_id_t c : crowded) {
        const auto occ = roster.occupants(c);
        Collision col{c, std::vector<agent_id_t>(occ.begin(), occ.end())};
        std::sort(col.agents.begin(), col.agents.end());
        out.push_back(std::move(col));
    }
    return out;
}

// Single writer: removes every colliding agent, then destroys each colony.
template <class G, class R>
    requires ColonyGraphLike<G> && RosterLike<R>
inline void destroy_collisions(G& graph, R& roster, std::span<const Collision> collisions) {
    for (const Collision& col : collisions) {
        for (agent_id_t a : col.agents) roster.remove(a);
        graph.destroy(col.colony);
    }
}

// Termination sweep; read-only, so the active set is split across OpenMP threads.
template <class G, class R>
    requires ColonyGraphLike<G> && RosterLike<R>
inline bool any_agent_can_move(const G& graph, const R& roster, std::span<const agent_id_t> agents,
                               std::uint64_t max_moves, std::size_t grain) {
    const std::ptrdiff_t n = static_cast<std::ptrdiff_t>(agents.size());
    const bool parallel = grain != 0 && agents.size() >= grain;
    bool any = false;
    #pragma omp parallel for reduction(||:any) if(parallel)
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        any = any || can_move(graph, roster, agents[static_cast<std::size_t>(i)], max_moves);
    }
    return any;
}

} // namespace antsim::sim
