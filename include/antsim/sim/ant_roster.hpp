// ant_roster.hpp: active agents, their colonies and the colony -> occupants index
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "antsim/core/config.hpp"

namespace antsim::sim {

using core::agent_id_t;
using core::colony_id_t;

/**
 * @brief Tracks where every live agent is.
 * @details Agent ids are dense. An agent is active from its first place()
 * until remove(). occupants() is kept in sync with colony_of() on every
 * mutation; co-location is allowed (collisions are detected by the caller).
 */
class AntRoster {
public:
    AntRoster() = default;
    explicit AntRoster(std::size_t colony_capacity) { reserve_colonies(colony_capacity); }

    // Grow the colony index to cover ids [0, capacity).
    void reserve_colonies(std::size_t capacity);

    // Assign or relocate an agent.
    void place(agent_id_t agent, colony_id_t colony);

    // Drop an agent from every index. Returns false if it was not active.
    bool remove(agent_id_t agent);

    [[nodiscard]] std::span<const agent_id_t> occupants(colony_id_t colony) const noexcept {
        if (colony >= occupants_.size()) return {};
        return occupants_[colony];
    }

    // Ascending-id snapshot of the active set.
    [[nodiscard]] std::vector<agent_id_t> active_agents() const;

    [[nodiscard]] std::optional<colony_id_t> colony_of(agent_id_t agent) const noexcept {
        if (!contains(agent)) return std::nullopt;
        return colony_[agent];
    }

    // Hot-path variant: kNoColony for removed or unknown agents.
    [[nodiscard]] colony_id_t position(agent_id_t agent) const noexcept {
        return agent < colony_.size() ? colony_[agent] : core::kNoColony;
    }

    [[nodiscard]] bool contains(agent_id_t agent) const noexcept {
        return agent < colony_.size() && colony_[agent] != core::kNoColony;
    }

    [[nodiscard]] std::size_t active_count() const noexcept { return active_.size(); }
    // Agent ids issued so far; per-agent scratch tables size to this.
    [[nodiscard]] std::size_t id_capacity() const noexcept { return colony_.size(); }
    [[nodiscard]] bool empty() const noexcept { return active_.empty(); }

    // Moves made so far (kept after removal).
    [[nodiscard]] std::uint64_t moves(agent_id_t agent) const noexcept {
        return agent < moves_.size() ? moves_[agent] : 0;
    }
    void record_move(agent_id_t agent) noexcept {
        if (agent < moves_.size()) ++moves_[agent];
    }

private:
    static constexpr std::size_t NPOS = static_cast<std::size_t>(-1);

    void detach_(agent_id_t agent, colony_id_t colony);

    std::vector<colony_id_t>              colony_;      // per agent, kNoColony if inactive
    std::vector<std::uint64_t>            moves_;       // per agent
    std::vector<std::size_t>              active_pos_;  // index in active_ or NPOS
    std::vector<agent_id_t>               active_;      // unordered pool
    std::vector<std::vector<agent_id_t>>  occupants_;   // per colony
};

} // namespace antsim::sim
