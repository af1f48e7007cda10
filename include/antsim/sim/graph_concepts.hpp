// graph_concepts.hpp: minimal graph/roster requirements for the tick phases
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "antsim/core/config.hpp"
#include "antsim/graphs/colony_graph.hpp"

namespace antsim::sim {

using core::agent_id_t;
using core::colony_id_t;

// A graph type G models ColonyGraphLike if it provides the API consumed by
// sim/tick.hpp and sim/placement.hpp. neighbors() must be safe to call from
// several threads at once while no mutation is in flight.
template <class G>
concept ColonyGraphLike = requires(G& g, const G& cg, colony_id_t c) {
    { cg.neighbors(c) } -> std::convertible_to<std::span<const graphs::Edge>>;
    { cg.exists(c) } -> std::convertible_to<bool>;
    { cg.colony_count() } -> std::convertible_to<std::size_t>;
    { cg.capacity() } -> std::convertible_to<std::size_t>;
    { cg.for_each_colony([](colony_id_t) {}) };
    { g.destroy(c) } -> std::convertible_to<bool>;
};

template <class R>
concept RosterLike = requires(R& r, const R& cr, agent_id_t a, colony_id_t c) {
    { r.place(a, c) } -> std::same_as<void>;
    { r.remove(a) } -> std::convertible_to<bool>;
    { r.record_move(a) };
    { cr.occupants(c) } -> std::convertible_to<std::span<const agent_id_t>>;
    { cr.position(a) } -> std::convertible_to<colony_id_t>;
    { cr.moves(a) } -> std::convertible_to<std::uint64_t>;
    { cr.id_capacity() } -> std::convertible_to<std::size_t>;
};

} // namespace antsim::sim
