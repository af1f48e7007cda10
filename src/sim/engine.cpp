#include "antsim/sim/engine.hpp"

#include <limits>
#include <sstream>
#include <utility>

#include "antsim/core/errors.hpp"
#include "antsim/core/log.hpp"
#include "antsim/core/rng.hpp"

namespace antsim::sim {

const char* to_string(Termination t) noexcept {
    switch (t) {
        case Termination::None:               return "running";
        case Termination::AllAgentsDestroyed: return "all ants destroyed";
        case Termination::NoLegalMoves:       return "no ant can move";
        case Termination::TickLimit:          return "tick limit reached";
    }
    return "unknown";
}

Engine::Engine(graphs::ColonyGraph graph, EngineConfig cfg, EventListener listener)
    : graph_(std::move(graph)), cfg_(cfg), listener_(std::move(listener)) {
    if (cfg_.agents > static_cast<std::size_t>(std::numeric_limits<agent_id_t>::max())) {
        throw InvalidConfiguration("agent count exceeds the supported id range");
    }

    initial_colonies_ = graph_.colony_count();
    roster_.reserve_colonies(graph_.capacity());

    core::SplitMix64 rng(core::splitmix_hash(cfg_.seed));
    seed_agents(graph_, roster_, cfg_.agents, cfg_.placement, rng);
    initial_agents_ = roster_.active_count();

    log::debug("engine: " + std::to_string(initial_agents_) + " ants on "
               + std::to_string(initial_colonies_) + " colonies, placement "
               + to_string(cfg_.placement) + ", seed " + std::to_string(cfg_.seed));

    // Shared placement can start several ants on one colony.
    const auto agents = roster_.active_agents();
    resolve_collisions_(agents);
    update_state_();
}

bool Engine::step() {
    if (state_ == State::Terminated) return false;
    ++tick_;

    const auto movers = roster_.active_agents();
    const TickParams p{cfg_.seed, tick_, cfg_.max_moves, cfg_.parallel_grain};

    plan_moves(graph_, roster_, movers, p, scratch_);
    catch_crossings(roster_, movers, p.grain, scratch_);
    const std::size_t moved = apply_moves(roster_, movers, scratch_);

    const std::size_t before = events_.size();
    resolve_collisions_(movers);

    if (log::enabled(log::Level::Debug)) {
        std::ostringstream os;
        os << "tick " << tick_ << ": moved=" << moved
           << " collisions=" << (events_.size() - before)
           << " ants=" << roster_.active_count()
           << " colonies=" << graph_.colony_count();
        log::debug(os.str());
    }

    update_state_();
    return state_ == State::Running;
}

RunResult Engine::run() {
    while (step()) {}
    return result();
}

RunResult Engine::result() const {
    RunResult r;
    r.ticks              = tick_;
    r.reason             = reason_;
    r.initial_colonies   = initial_colonies_;
    r.surviving_colonies = graph_.colony_count();
    r.initial_agents     = initial_agents_;
    r.surviving_agents   = roster_.active_count();
    r.events             = events_.size();
    return r;
}

void Engine::resolve_collisions_(std::span<const agent_id_t> agents) {
    const auto collisions = find_collisions(roster_, agents);
    if (collisions.empty()) return;

    // Record against the snapshot first, then mutate.
    const std::size_t first = events_.size();
    for (const Collision& c : collisions) {
        events_.push_back(DestructionEvent{tick_, c.colony, graph_.name(c.colony), c.agents});
    }
    destroy_collisions(graph_, roster_, collisions);

    if (listener_) {
        for (std::size_t i = first; i < events_.size(); ++i) listener_(events_[i]);
    }
}

void Engine::update_state_() {
    if (state_ == State::Terminated) return;

    if (roster_.empty()) {
        reason_ = Termination::AllAgentsDestroyed;
    } else if (!any_agent_can_move(graph_, roster_, roster_.active_agents(), cfg_.max_moves, cfg_.parallel_grain)) {
        reason_ = Termination::NoLegalMoves;
    } else if (cfg_.max_ticks != 0 && tick_ >= cfg_.max_ticks) {
        reason_ = Termination::TickLimit;
        log::debug("engine: tick cap " + std::to_string(cfg_.max_ticks) + " reached with "
                   + std::to_string(roster_.active_count()) + " ants still able to move");
    } else {
        return;
    }

    state_ = State::Terminated;
    log::debug(std::string("engine: terminated at tick ") + std::to_string(tick_) + " (" + to_string(reason_) + ")");
}

} // namespace antsim::sim
