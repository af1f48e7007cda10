#include "antsim/graphs/colony_graph.hpp"

#include <algorithm>

#include "antsim/core/errors.hpp"

namespace antsim::graphs {

colony_id_t ColonyGraph::add_colony(const std::string& name) {
    if (auto it = index_.find(name); it != index_.end()) return it->second;

    const auto id = static_cast<colony_id_t>(names_.size());
    names_.push_back(name);
    alive_.push_back(1);
    out_.emplace_back();
    in_.emplace_back();
    index_.emplace(name, id);
    ++live_;
    return id;
}

void ColonyGraph::add_edge(const std::string& from, const std::string& direction, const std::string& to) {
    add_edge(require_(from), direction, require_(to));
}

void ColonyGraph::add_edge(colony_id_t from, const std::string& direction, colony_id_t to) {
    require_(from);
    require_(to);
    const direction_id_t d = intern_direction_(direction);

    auto& edges = out_[from];
    auto it = std::find_if(edges.begin(), edges.end(), [d](const Edge& e) { return e.direction == d; });
    if (it == edges.end()) {
        edges.push_back(Edge{d, to});
        in_[to].push_back(InRef{from, d});
        ++edges_;
        return;
    }
    if (it->target == to) return;

    // Overwrite: drop the reverse entry of the replaced target.
    std::erase(in_[it->target], InRef{from, d});
    it->target = to;
    in_[to].push_back(InRef{from, d});
}

std::vector<std::pair<std::string, std::string>> ColonyGraph::neighbors(const std::string& name) const {
    std::vector<std::pair<std::string, std::string>> out;
    const auto id = find(name);
    if (!id) return out;
    out.reserve(out_[*id].size());
    for (const Edge& e : out_[*id]) out.emplace_back(directions_[e.direction], names_[e.target]);
    return out;
}

bool ColonyGraph::destroy(colony_id_t c) {
    if (!exists(c)) return false;

    // Incoming edges: each reverse entry names exactly one live edge.
    for (const InRef& ref : in_[c]) {
        if (ref.source == c) continue; // self-loop, dropped with out_[c] below
        auto& edges = out_[ref.source];
        const auto removed = std::erase(edges, Edge{ref.direction, c});
        ANTSIM_ASSERT_H(removed == 1, "colony_graph: reverse index out of sync");
        edges_ -= removed;
    }
    in_[c].clear();
    in_[c].shrink_to_fit();

    // Outgoing edges: unregister from each target's reverse index.
    for (const Edge& e : out_[c]) {
        if (e.target != c) std::erase(in_[e.target], InRef{c, e.direction});
        --edges_;
    }
    out_[c].clear();
    out_[c].shrink_to_fit();

    alive_[c] = 0;
    index_.erase(names_[c]);
    --live_;
    return true;
}

bool ColonyGraph::destroy(const std::string& name) {
    const auto id = find(name);
    return id ? destroy(*id) : false;
}

std::optional<colony_id_t> ColonyGraph::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

direction_id_t ColonyGraph::intern_direction_(const std::string& label) {
    if (auto it = direction_index_.find(label); it != direction_index_.end()) return it->second;
    const auto id = static_cast<direction_id_t>(directions_.size());
    directions_.push_back(label);
    direction_index_.emplace(label, id);
    return id;
}

colony_id_t ColonyGraph::require_(const std::string& name) const {
    const auto id = find(name);
    if (!id) throw UnknownColony(name);
    return *id;
}

void ColonyGraph::require_(colony_id_t c) const {
    if (exists(c)) return;
    throw UnknownColony(c < names_.size() ? names_[c] : "#" + std::to_string(c));
}

} // namespace antsim::graphs
