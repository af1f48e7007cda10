#pragma once
/*
colony_graph.hpp: mutable directed multigraph of named colonies

LAYOUT
- Colonies are interned to dense ids in creation order; ids are never reused.
- out_[c]  : outgoing edges of c in insertion order, at most one per direction.
- in_[c]   : reverse index, every (source, direction) whose edge targets c.
- Direction labels are opaque strings interned to dense ids.

COMPLEXITY
- neighbors(c), exists(c), colony_count(), edge_count(): O(1).
- destroy(c): O(in_degree(c) * out_degree(source) + out_degree(c) * in_degree(target)),
  i.e. proportional to the edges touching c, never to the whole map.

INVARIANT
- in_ and out_ describe the same edge set. After destroy(c) returns, no live
  colony has an edge to c.

CONCURRENCY
- const member functions may run concurrently with each other; any mutation
  requires exclusive access (the engine destroys from a single writer).
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "antsim/core/config.hpp"

namespace antsim::graphs {

using core::colony_id_t;
using core::direction_id_t;

struct Edge {
    direction_id_t direction;
    colony_id_t    target;

    friend bool operator==(const Edge&, const Edge&) = default;
};

class ColonyGraph {
public:
    ColonyGraph() = default;

    // Idempotent: returns the id of the live colony with this name, creating
    // it (without edges) when absent.
    colony_id_t add_colony(const std::string& name);

    // Records from --direction--> to, replacing any edge already stored for
    // (from, direction). Throws UnknownColony if either endpoint is absent.
    void add_edge(const std::string& from, const std::string& direction, const std::string& to);
    void add_edge(colony_id_t from, const std::string& direction, colony_id_t to);

    // Current outgoing edges; empty for dead ends and absent colonies.
    [[nodiscard]] std::span<const Edge> neighbors(colony_id_t c) const noexcept {
        if (!exists(c)) return {};
        return out_[c];
    }
    // (direction, target) names, for callers that work with names.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> neighbors(const std::string& name) const;

    // Removes the colony, its outgoing edges and every edge pointing at it.
    // Returns false (no-op) when the colony is already gone.
    bool destroy(colony_id_t c);
    bool destroy(const std::string& name);

    [[nodiscard]] std::size_t colony_count() const noexcept { return live_; }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_; }
    // Ids issued so far (live and destroyed); id-indexed tables size to this.
    [[nodiscard]] std::size_t capacity() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return live_ == 0; }

    [[nodiscard]] bool exists(colony_id_t c) const noexcept {
        return c < alive_.size() && alive_[c] != 0;
    }
    [[nodiscard]] bool exists(const std::string& name) const { return find(name).has_value(); }

    // Live colony id for a name.
    [[nodiscard]] std::optional<colony_id_t> find(const std::string& name) const;

    // Names stay resolvable after destruction (events report them).
    [[nodiscard]] const std::string& name(colony_id_t c) const { return names_.at(c); }
    [[nodiscard]] const std::string& direction_name(direction_id_t d) const { return directions_.at(d); }

    // Visits live colonies in creation order: f(colony_id_t).
    template <class F>
    void for_each_colony(F&& f) const {
        for (std::size_t c = 0; c < alive_.size(); ++c) {
            if (alive_[c]) f(static_cast<colony_id_t>(c));
        }
    }

private:
    struct InRef {
        colony_id_t    source;
        direction_id_t direction;

        friend bool operator==(const InRef&, const InRef&) = default;
    };

    direction_id_t intern_direction_(const std::string& label);
    colony_id_t require_(const std::string& name) const;
    void require_(colony_id_t c) const;

    std::vector<std::string>                      names_;
    std::vector<unsigned char>                    alive_;
    std::vector<std::vector<Edge>>                out_;
    std::vector<std::vector<InRef>>               in_;
    std::unordered_map<std::string, colony_id_t>  index_;   // live colonies only

    std::vector<std::string>                         directions_;
    std::unordered_map<std::string, direction_id_t>  direction_index_;

    std::size_t live_{0};
    std::size_t edges_{0};
};

} // namespace antsim::graphs
