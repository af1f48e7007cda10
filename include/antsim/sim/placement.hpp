// placement.hpp: initial agent placement strategies
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "antsim/core/errors.hpp"
#include "antsim/core/rng.hpp"
#include "antsim/sim/graph_concepts.hpp"

namespace antsim::sim {

// shared   : every agent picks a live colony uniformly and independently;
//            agents that land together collide before the first move.
// distinct : agents start on pairwise distinct colonies (needs N <= colonies).
enum class Placement { Shared, Distinct };

inline const char* to_string(Placement p) noexcept {
    return p == Placement::Distinct ? "distinct" : "shared";
}

inline std::optional<Placement> parse_placement(std::string_view s) {
    if (s == "shared")   return Placement::Shared;
    if (s == "distinct") return Placement::Distinct;
    return std::nullopt;
}

template <class G>
    requires ColonyGraphLike<G>
inline std::vector<colony_id_t> live_colonies(const G& graph) {
    std::vector<colony_id_t> ids;
    ids.reserve(graph.colony_count());
    graph.for_each_colony([&](colony_id_t c) { ids.push_back(c); });
    return ids;
}

// Agents 0..n-1, each on a uniform live colony (with replacement).
template <class G, class R, class URBG>
    requires ColonyGraphLike<G> && RosterLike<R>
inline void place_shared(const G& graph, R& roster, std::size_t n, URBG& rng) {
    const auto ids = live_colonies(graph);
    if (ids.empty()) return;
    for (std::size_t a = 0; a < n; ++a) {
        const auto k = core::uniform_bounded(rng, ids.size());
        roster.place(static_cast<agent_id_t>(a), ids[static_cast<std::size_t>(k)]);
    }
}

// Floyd's algorithm: K distinct positions out of N in K draws, no shuffling
// of the full id list. The K picks are then permuted (Fisher-Yates on the
// same stream) so agent ids are not tied to colony load order.
template <class G, class R, class URBG>
    requires ColonyGraphLike<G> && RosterLike<R>
inline void place_distinct(const G& graph, R& roster, std::size_t n, URBG& rng) {
    const auto ids = live_colonies(graph);
    const std::size_t N = ids.size();
    const std::size_t K = n < N ? n : N;

    std::vector<unsigned char> chosen(N, 0);
    for (std::size_t j = N - K; j < N; ++j) {
        const std::size_t t = static_cast<std::size_t>(core::uniform_bounded(rng, j + 1));
        if (chosen[t]) chosen[j] = 1;
        else           chosen[t] = 1;
    }

    std::vector<colony_id_t> picks;
    picks.reserve(K);
    for (std::size_t i = 0; i < N; ++i) {
        if (chosen[i]) picks.push_back(ids[i]);
    }
    for (std::size_t i = picks.size(); i > 1; --i) {
        const std::size_t j = static_cast<std::size_t>(core::uniform_bounded(rng, i));
        std::swap(picks[i - 1], picks[j]);
    }

    for (std::size_t a = 0; a < picks.size(); ++a) {
        roster.place(static_cast<agent_id_t>(a), picks[a]);
    }
}

// Validates the request against the map, then places. Throws
// InvalidConfiguration for n == 0, an empty map, or distinct placement
// with more agents than colonies.
template <class G, class R, class URBG>
    requires ColonyGraphLike<G> && RosterLike<R>
inline void seed_agents(const G& graph, R& roster, std::size_t n, Placement policy, URBG& rng) {
    if (n == 0) throw InvalidConfiguration("agent count must be positive");
    if (graph.colony_count() == 0) throw InvalidConfiguration("map has no colonies");
    if (policy == Placement::Distinct && n > graph.colony_count()) {
        throw InvalidConfiguration("distinct placement needs at least as many colonies as agents ("
                                   + std::to_string(n) + " agents, "
                                   + std::to_string(graph.colony_count()) + " colonies)");
    }
    if (policy == Placement::Distinct) place_distinct(graph, roster, n, rng);
    else                               place_shared(graph, roster, n, rng);
}

} // namespace antsim::sim
