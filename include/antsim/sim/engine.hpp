// engine.hpp: simulation engine: seeding, tick loop, termination, event log
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "antsim/core/config.hpp"
#include "antsim/graphs/colony_graph.hpp"
#include "antsim/sim/ant_roster.hpp"
#include "antsim/sim/placement.hpp"
#include "antsim/sim/tick.hpp"

namespace antsim::sim {

enum class State { Running, Terminated };

enum class Termination {
    None,                // still running
    AllAgentsDestroyed,
    NoLegalMoves,        // every survivor is trapped or exhausted
    TickLimit,
};

const char* to_string(Termination t) noexcept;

struct DestructionEvent {
    core::tick_t            tick;       // 0 = collision at placement
    colony_id_t             colony_id;
    std::string             colony;
    std::vector<agent_id_t> agents;     // ascending
};

struct EngineConfig {
    std::size_t   agents{0};
    std::uint64_t seed{0};
    std::uint64_t max_ticks{core::config::default_max_ticks};  // 0 -> no cap
    std::uint64_t max_moves{core::config::default_max_moves};  // per agent, 0 -> no cap
    Placement     placement{Placement::Shared};
    std::size_t   parallel_grain{core::config::default_parallel_grain};
};

struct RunResult {
    core::tick_t ticks{0};
    Termination  reason{Termination::None};
    std::size_t  initial_colonies{0};
    std::size_t  surviving_colonies{0};
    std::size_t  initial_agents{0};
    std::size_t  surviving_agents{0};
    std::size_t  events{0};

    std::size_t colonies_destroyed() const noexcept { return initial_colonies - surviving_colonies; }
    std::size_t agents_destroyed() const noexcept { return initial_agents - surviving_agents; }
};

/**
 * @brief Owns the map and the agents for one run and advances them tick by tick.
 * @details The constructor validates the configuration, places the agents
 * and resolves collisions caused by the placement itself (tick 0). After
 * that step() advances one tick until state() is Terminated. Given the same
 * graph and seed, the event sequence and final map are identical whatever
 * the number of worker threads.
 */
class Engine {
public:
    using EventListener = std::function<void(const DestructionEvent&)>;

    /**
     * @brief Take ownership of the map and seed the agents.
     * @param graph Initial map.
     * @param cfg Run configuration.
     * @param listener Optional sink called for each event as it happens.
     * @throws InvalidConfiguration when the agents cannot be placed.
     */
    Engine(graphs::ColonyGraph graph, EngineConfig cfg, EventListener listener = {});

    /**
     * @brief Advance one tick.
     * @return true while the simulation is still running afterwards.
     */
    bool step();

    // Steps until terminated.
    RunResult run();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool running() const noexcept { return state_ == State::Running; }
    [[nodiscard]] Termination termination() const noexcept { return reason_; }
    [[nodiscard]] core::tick_t tick() const noexcept { return tick_; }

    [[nodiscard]] const graphs::ColonyGraph& graph() const noexcept { return graph_; }
    [[nodiscard]] const AntRoster& roster() const noexcept { return roster_; }
    [[nodiscard]] const std::vector<DestructionEvent>& events() const noexcept { return events_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }

    [[nodiscard]] RunResult result() const;

private:
    void resolve_collisions_(std::span<const agent_id_t> agents);
    void update_state_();

    graphs::ColonyGraph graph_;
    AntRoster           roster_;
    EngineConfig        cfg_;
    EventListener       listener_;

    State        state_{State::Running};
    Termination  reason_{Termination::None};
    core::tick_t tick_{0};

    std::vector<DestructionEvent> events_;
    MoveScratch                   scratch_;

    std::size_t initial_colonies_{0};
    std::size_t initial_agents_{0};
};

} // namespace antsim::sim
