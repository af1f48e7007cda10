// test_colony_graph.cpp
// Focused doctest checks for graphs::ColonyGraph: creation, edge overwrite,
// destruction with reverse-index cleanup, and a randomized no-dangling sweep.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "antsim/core/errors.hpp"
#include "antsim/graphs/colony_graph.hpp"

using antsim::graphs::ColonyGraph;
using antsim::graphs::colony_id_t;

namespace testutil {

using Links = std::vector<std::pair<std::string, std::string>>;

// Slow reference: every live edge must target a live colony and appear
// in the target's incoming set exactly once (checked via counting).
inline void check_no_dangling(const ColonyGraph& g) {
    std::size_t edges = 0;
    g.for_each_colony([&](colony_id_t c) {
        for (const auto& e : g.neighbors(c)) {
            CAPTURE(g.name(c));
            CHECK(g.exists(e.target));
            ++edges;
        }
    });
    CHECK(edges == g.edge_count());
}

} // namespace testutil

// -----------------------------------------------------------------------------
// Creation and lookup
// -----------------------------------------------------------------------------

TEST_CASE("add_colony is idempotent and ids are dense") {
    ColonyGraph g;
    const auto a = g.add_colony("Fizz");
    const auto b = g.add_colony("Buzz");
    CHECK(a == 0);
    CHECK(b == 1);
    CHECK(g.add_colony("Fizz") == a);
    CHECK(g.colony_count() == 2);
    CHECK(g.capacity() == 2);
    CHECK(g.exists("Fizz"));
    CHECK(g.exists(b));
    CHECK_FALSE(g.exists("Bazz"));
    CHECK_FALSE(g.exists(colony_id_t{7}));
    CHECK(g.neighbors(a).empty());
}

TEST_CASE("neighbors keeps insertion order and one edge per direction") {
    ColonyGraph g;
    for (const char* n : {"A", "B", "C"}) g.add_colony(n);
    g.add_edge("A", "north", "B");
    g.add_edge("A", "east", "C");
    g.add_edge("A", "north", "C"); // overwrite

    CHECK(g.neighbors("A") == testutil::Links{{"north", "C"}, {"east", "C"}});
    CHECK(g.edge_count() == 2);
    CHECK(g.neighbors("Nope").empty());

    // The replaced edge must not be cleaned up again when B dies.
    CHECK(g.destroy("B"));
    CHECK(g.neighbors("A").size() == 2);
    testutil::check_no_dangling(g);
}

TEST_CASE("add_edge against a missing colony throws UnknownColony") {
    ColonyGraph g;
    g.add_colony("A");
    CHECK_THROWS_AS(g.add_edge("A", "north", "B"), antsim::UnknownColony);
    CHECK_THROWS_AS(g.add_edge("B", "north", "A"), antsim::UnknownColony);
    try {
        g.add_edge("A", "west", "Ghost");
    } catch (const antsim::UnknownColony& e) {
        CHECK(e.name() == "Ghost");
    }
    CHECK(g.edge_count() == 0);
}

// -----------------------------------------------------------------------------
// Destruction
// -----------------------------------------------------------------------------

TEST_CASE("destroy removes incoming and outgoing edges only around the colony") {
    ColonyGraph g;
    for (const char* n : {"A", "B", "C", "D"}) g.add_colony(n);
    g.add_edge("A", "east", "B");
    g.add_edge("C", "west", "B");
    g.add_edge("B", "south", "D");
    g.add_edge("D", "north", "B");
    g.add_edge("A", "south", "C");
    REQUIRE(g.edge_count() == 5);

    CHECK(g.destroy("B"));
    CHECK_FALSE(g.exists("B"));
    CHECK(g.colony_count() == 3);
    CHECK(g.edge_count() == 1);
    CHECK(g.neighbors("A") == testutil::Links{{"south", "C"}});
    CHECK(g.neighbors("C").empty());
    CHECK(g.neighbors("D").empty());

    // Names stay resolvable for reporting.
    CHECK(g.name(1) == "B");
    testutil::check_no_dangling(g);
}

TEST_CASE("destroy is idempotent") {
    ColonyGraph g;
    g.add_colony("A");
    CHECK(g.destroy("A"));
    CHECK_FALSE(g.destroy("A"));
    CHECK_FALSE(g.destroy(colony_id_t{0}));
    CHECK_FALSE(g.destroy(colony_id_t{42}));
    CHECK(g.colony_count() == 0);
    CHECK(g.empty());
}

TEST_CASE("self-loops and mutual edges are released once") {
    ColonyGraph g;
    g.add_colony("A");
    g.add_colony("B");
    g.add_edge("A", "up", "A");
    g.add_edge("A", "east", "B");
    g.add_edge("B", "west", "A");
    REQUIRE(g.edge_count() == 3);

    CHECK(g.destroy("A"));
    CHECK(g.edge_count() == 0);
    CHECK(g.neighbors("B").empty());
}

TEST_CASE("for_each_colony visits live colonies in creation order") {
    ColonyGraph g;
    for (const char* n : {"A", "B", "C", "D"}) g.add_colony(n);
    g.destroy("B");
    std::vector<std::string> seen;
    g.for_each_colony([&](colony_id_t c) { seen.push_back(g.name(c)); });
    CHECK(seen == std::vector<std::string>{"A", "C", "D"});
}

// -----------------------------------------------------------------------------
// Random graphs: destroy in random order, no edge may outlive its target
// -----------------------------------------------------------------------------

TEST_CASE("random destruction order never leaves dangling edges") {
    std::mt19937_64 rng(0xC0105EEDULL);
    const char* dirs[] = {"north", "south", "east", "west"};

    for (int trial = 0; trial < 20; ++trial) {
        CAPTURE(trial);
        ColonyGraph g;
        const int n = 40;
        for (int i = 0; i < n; ++i) g.add_colony("c" + std::to_string(i));
        std::uniform_int_distribution<int> pick(0, n - 1);
        for (int i = 0; i < n; ++i) {
            for (const char* d : dirs) {
                if (rng() & 1u) g.add_edge("c" + std::to_string(i), d, "c" + std::to_string(pick(rng)));
            }
        }
        testutil::check_no_dangling(g);

        std::vector<int> order(n);
        for (int i = 0; i < n; ++i) order[i] = i;
        std::shuffle(order.begin(), order.end(), rng);
        std::size_t live = n;
        for (int i : order) {
            CHECK(g.destroy("c" + std::to_string(i)));
            --live;
            CHECK(g.colony_count() == live);
            testutil::check_no_dangling(g);
        }
        CHECK(g.edge_count() == 0);
    }
}
