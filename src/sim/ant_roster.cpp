#include "antsim/sim/ant_roster.hpp"

#include <algorithm>

namespace antsim::sim {

void AntRoster::reserve_colonies(std::size_t capacity) {
    if (occupants_.size() < capacity) occupants_.resize(capacity);
}

void AntRoster::place(agent_id_t agent, colony_id_t colony) {
    ANTSIM_ASSERT_H(colony != core::kNoColony, "ant_roster: place on kNoColony");
    if (agent >= colony_.size()) {
        const std::size_t n = static_cast<std::size_t>(agent) + 1;
        colony_.resize(n, core::kNoColony);
        moves_.resize(n, 0);
        active_pos_.resize(n, NPOS);
    }

    const colony_id_t old = colony_[agent];
    if (old == colony) return;
    if (old != core::kNoColony) {
        detach_(agent, old);
    } else {
        active_pos_[agent] = active_.size();
        active_.push_back(agent);
    }

    reserve_colonies(static_cast<std::size_t>(colony) + 1);
    occupants_[colony].push_back(agent);
    colony_[agent] = colony;
}

bool AntRoster::remove(agent_id_t agent) {
    if (!contains(agent)) return false;

    detach_(agent, colony_[agent]);
    colony_[agent] = core::kNoColony;

    // swap-pop from the active pool
    const std::size_t pos = active_pos_[agent];
    const agent_id_t last = active_.back();
    active_[pos] = last;
    active_pos_[last] = pos;
    active_.pop_back();
    active_pos_[agent] = NPOS;
    return true;
}

std::vector<agent_id_t> AntRoster::active_agents() const {
    std::vector<agent_id_t> out(active_);
    std::sort(out.begin(), out.end());
    return out;
}

void AntRoster::detach_(agent_id_t agent, colony_id_t colony) {
    auto& occ = occupants_[colony];
    auto it = std::find(occ.begin(), occ.end(), agent);
    ANTSIM_ASSERT_H(it != occ.end(), "ant_roster: occupancy index out of sync");
    if (it == occ.end()) return;
    *it = occ.back();
    occ.pop_back();
}

} // namespace antsim::sim
