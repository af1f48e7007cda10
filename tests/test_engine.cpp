// test_engine.cpp
// doctest scenarios for sim::Engine: the classic two-colony map, trapped and
// circling ants, multi-ant collisions, move caps, and thread-count
// independence of the event log.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <tbb/task_arena.h>

#include "antsim/core/errors.hpp"
#include "antsim/graphs/colony_graph.hpp"
#include "antsim/io/map_parser.hpp"
#include "antsim/io/report.hpp"
#include "antsim/sim/engine.hpp"

using namespace antsim;
using sim::agent_id_t;
using sim::colony_id_t;
using sim::Placement;
using sim::Termination;

namespace {

sim::EngineConfig make_cfg(std::size_t agents, std::uint64_t seed, Placement p = Placement::Distinct) {
    sim::EngineConfig c;
    c.agents = agents;
    c.seed = seed;
    c.placement = p;
    return c;
}

graphs::ColonyGraph grid(int side) {
    graphs::ColonyGraph g;
    auto nm = [](int x, int y) { return "g" + std::to_string(x) + "x" + std::to_string(y); };
    for (int y = 0; y < side; ++y)
        for (int x = 0; x < side; ++x) g.add_colony(nm(x, y));
    for (int y = 0; y < side; ++y) {
        for (int x = 0; x < side; ++x) {
            if (x + 1 < side) g.add_edge(nm(x, y), "east", nm(x + 1, y));
            if (x > 0)        g.add_edge(nm(x, y), "west", nm(x - 1, y));
            if (y + 1 < side) g.add_edge(nm(x, y), "south", nm(x, y + 1));
            if (y > 0)        g.add_edge(nm(x, y), "north", nm(x, y - 1));
        }
    }
    return g;
}

struct Trace {
    std::vector<core::tick_t> ticks;
    std::vector<std::string>  colonies;
    std::vector<std::vector<agent_id_t>> agents;
    std::string remaining_map;   // live colonies and tunnels, map syntax
    sim::RunResult result;

    bool operator==(const Trace& o) const {
        return ticks == o.ticks && colonies == o.colonies && agents == o.agents
            && remaining_map == o.remaining_map
            && result.ticks == o.result.ticks && result.reason == o.result.reason
            && result.surviving_agents == o.result.surviving_agents
            && result.surviving_colonies == o.result.surviving_colonies;
    }
};

Trace trace_run(const graphs::ColonyGraph& g, const sim::EngineConfig& cfg) {
    sim::Engine e(g, cfg);
    Trace t;
    t.result = e.run();
    for (const auto& ev : e.events()) {
        t.ticks.push_back(ev.tick);
        t.colonies.push_back(ev.colony);
        t.agents.push_back(ev.agents);
    }
    std::ostringstream os;
    io::write_remaining_map(os, e.graph());
    t.remaining_map = os.str();
    return t;
}

} // namespace

// -----------------------------------------------------------------------------
// Small hand-checked maps
// -----------------------------------------------------------------------------

TEST_CASE("two ants on Fizz <-> Buzz destroy exactly one colony") {
    const auto g = io::parse_map_string("Fizz north=Buzz\nBuzz south=Fizz\n");
    for (std::uint64_t seed = 0; seed < 10; ++seed) {
        CAPTURE(seed);
        sim::Engine e(g, make_cfg(2, seed));
        const auto r = e.run();

        CHECK(r.reason == Termination::AllAgentsDestroyed);
        CHECK(r.ticks == 1);
        CHECK(r.colonies_destroyed() == 1);
        CHECK(r.surviving_agents == 0);
        REQUIRE(e.events().size() == 1);
        CHECK(e.events()[0].agents == std::vector<agent_id_t>{0, 1});
        CHECK(e.graph().colony_count() == 1);
        // The survivor lost its only tunnel.
        e.graph().for_each_colony([&](colony_id_t c) { CHECK(e.graph().neighbors(c).empty()); });
    }
}

TEST_CASE("distinct Fizz/Buzz runs destroy either colony depending on the seed") {
    const auto g = io::parse_map_string("Fizz north=Buzz\nBuzz south=Fizz\n");
    std::set<std::string> destroyed;
    for (std::uint64_t seed = 0; seed < 200; ++seed) {
        sim::Engine e(g, make_cfg(2, seed));
        e.run();
        REQUIRE(e.events().size() == 1);
        destroyed.insert(e.events()[0].colony);
    }
    CHECK(destroyed == std::set<std::string>{"Buzz", "Fizz"});
}

TEST_CASE("an ant alone on an isolated colony stops before the first tick") {
    graphs::ColonyGraph g;
    g.add_colony("Island");
    sim::Engine e(g, make_cfg(1, 7));
    CHECK_FALSE(e.running());
    CHECK(e.termination() == Termination::NoLegalMoves);

    const auto r = e.run();
    CHECK(r.ticks == 0);
    CHECK(r.events == 0);
    CHECK(r.surviving_agents == 1);
    CHECK(e.graph().exists("Island"));
    CHECK_FALSE(e.step());
}

TEST_CASE("three ants circling a 3-cycle never meet and hit the tick cap") {
    const auto g = io::parse_map_string("A next=B\nB next=C\nC next=A\n");
    auto cfg = make_cfg(3, 99);
    cfg.max_ticks = 50;
    sim::Engine e(g, cfg);
    const auto r = e.run();

    CHECK(r.reason == Termination::TickLimit);
    CHECK(r.ticks == 50);
    CHECK(r.events == 0);
    CHECK(r.surviving_agents == 3);
    CHECK(r.surviving_colonies == 3);
}

TEST_CASE("the per-ant move cap ends a run that would otherwise go on forever") {
    const auto g = io::parse_map_string("A next=B\nB next=C\nC next=A\n");
    auto cfg = make_cfg(3, 1);
    cfg.max_ticks = 0;
    cfg.max_moves = 5;
    sim::Engine e(g, cfg);
    const auto r = e.run();

    CHECK(r.reason == Termination::NoLegalMoves);
    CHECK(r.ticks == 5);
    for (agent_id_t a = 0; a < 3; ++a) CHECK(e.roster().moves(a) == 5);
}

TEST_CASE("four ants converging on a sink destroy it together") {
    const auto g = io::parse_map_string("P in=T\nQ in=T\nR in=T\nT\n");
    std::vector<std::string> seen;
    sim::Engine e(g, make_cfg(4, 3), [&](const sim::DestructionEvent& ev) { seen.push_back(ev.colony); });
    const auto r = e.run();

    CHECK(r.reason == Termination::AllAgentsDestroyed);
    CHECK(r.ticks == 1);
    REQUIRE(e.events().size() == 1);
    CHECK(e.events()[0].colony == "T");
    CHECK(e.events()[0].tick == 1);
    CHECK(e.events()[0].agents == std::vector<agent_id_t>{0, 1, 2, 3});
    CHECK(seen == std::vector<std::string>{"T"});
    CHECK(e.graph().colony_count() == 3);
    CHECK(e.graph().edge_count() == 0);
}

TEST_CASE("shared placement collisions are resolved at tick 0") {
    graphs::ColonyGraph g;
    g.add_colony("Only");
    int calls = 0;
    sim::Engine e(g, make_cfg(5, 2, Placement::Shared), [&](const sim::DestructionEvent& ev) {
        ++calls;
        CHECK(ev.tick == 0);
        CHECK(ev.agents.size() == 5);
    });
    CHECK(calls == 1);
    CHECK(e.termination() == Termination::AllAgentsDestroyed);
    CHECK(e.result().ticks == 0);
    CHECK(e.graph().empty());
}

TEST_CASE("invalid configurations are rejected up front") {
    const auto g = io::parse_map_string("A e=B\nB w=A\n");
    CHECK_THROWS_AS(sim::Engine(g, make_cfg(0, 1)), InvalidConfiguration);
    CHECK_THROWS_AS(sim::Engine(g, make_cfg(3, 1, Placement::Distinct)), InvalidConfiguration);
    CHECK_THROWS_AS(sim::Engine(graphs::ColonyGraph{}, make_cfg(1, 1, Placement::Shared)), InvalidConfiguration);
}

TEST_CASE("to_string names every termination reason") {
    CHECK(std::string(sim::to_string(Termination::AllAgentsDestroyed)) == "all ants destroyed");
    CHECK(std::string(sim::to_string(Termination::NoLegalMoves)) == "no ant can move");
    CHECK(std::string(sim::to_string(Termination::TickLimit)) == "tick limit reached");
    CHECK(std::string(sim::to_string(Termination::None)) == "running");
}

// -----------------------------------------------------------------------------
// Invariants on a larger random run
// -----------------------------------------------------------------------------

TEST_CASE("state only shrinks and the map never holds dangling tunnels") {
    auto cfg = make_cfg(150, 2024, Placement::Shared);
    cfg.max_ticks = 400;
    cfg.parallel_grain = 8;
    sim::Engine e(grid(20), cfg);

    std::size_t colonies = e.graph().colony_count();
    std::size_t ants = e.roster().active_count();
    std::size_t events = e.events().size();

    auto check_tick_start = [&] {
        // Between ticks every live ant sits alone on a live colony.
        for (agent_id_t a : e.roster().active_agents()) {
            const colony_id_t c = e.roster().position(a);
            CHECK(e.graph().exists(c));
            CHECK(e.roster().occupants(c).size() == 1);
        }
        e.graph().for_each_colony([&](colony_id_t c) {
            for (const auto& edge : e.graph().neighbors(c)) CHECK(e.graph().exists(edge.target));
        });
    };
    check_tick_start();

    while (e.step()) {
        CHECK(e.graph().colony_count() <= colonies);
        CHECK(e.roster().active_count() <= ants);
        CHECK(e.events().size() >= events);
        // Each event removes one colony and exactly the ants it lists.
        const std::size_t new_events = e.events().size() - events;
        std::size_t killed = 0;
        for (std::size_t i = events; i < e.events().size(); ++i) {
            CHECK(e.events()[i].agents.size() >= 2);
            killed += e.events()[i].agents.size();
        }
        CHECK(colonies - e.graph().colony_count() == new_events);
        CHECK(ants - e.roster().active_count() == killed);
        colonies = e.graph().colony_count();
        ants = e.roster().active_count();
        events = e.events().size();
        check_tick_start();
    }

    const auto r = e.result();
    CHECK(r.reason != Termination::None);
    CHECK(r.colonies_destroyed() == r.events);
    CHECK(r.ticks <= 400);
}

TEST_CASE("event order within a tick follows colony id") {
    auto cfg = make_cfg(300, 5, Placement::Shared);
    cfg.max_ticks = 200;
    sim::Engine e(grid(15), cfg);
    e.run();
    const auto& evs = e.events();
    for (std::size_t i = 1; i < evs.size(); ++i) {
        CHECK(evs[i - 1].tick <= evs[i].tick);
        if (evs[i - 1].tick == evs[i].tick) CHECK(evs[i - 1].colony_id < evs[i].colony_id);
    }
}

// -----------------------------------------------------------------------------
// Determinism
// -----------------------------------------------------------------------------

TEST_CASE("same seed, same run; worker count does not matter") {
    const auto g = grid(24);
    auto cfg = make_cfg(400, 0xBEEF, Placement::Shared);
    cfg.max_ticks = 300;

    cfg.parallel_grain = 0;
    const Trace serial = trace_run(g, cfg);

    cfg.parallel_grain = 1;
    Trace one, many;
    tbb::task_arena(1).execute([&] { one = trace_run(g, cfg); });
    tbb::task_arena(4).execute([&] { many = trace_run(g, cfg); });

    CHECK_FALSE(serial.remaining_map.empty());
    CHECK(serial == one);
    CHECK(serial == many);
    CHECK(trace_run(g, cfg) == many);

    cfg.seed = 0xBEEF + 1;
    CHECK_FALSE(trace_run(g, cfg) == serial);
}
