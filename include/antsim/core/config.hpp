// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

// Compile-time configuration for core facilities.
//
// Id widths are configurable so very large maps can trade memory for range.
// Defaults cover a few billion colonies and agents.

#ifndef ANTSIM_COLONY_ID_T
#define ANTSIM_COLONY_ID_T std::uint32_t
#endif

#ifndef ANTSIM_AGENT_ID_T
#define ANTSIM_AGENT_ID_T std::uint32_t
#endif

// Global hardening switch for invariant checks on the graph and roster.
// Set via compile flag: -DANTSIM_HARDENED=1
#ifndef ANTSIM_HARDENED
#define ANTSIM_HARDENED 0
#endif

#if ANTSIM_HARDENED
#include <stdexcept>
#define ANTSIM_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define ANTSIM_ASSERT_H(cond, msg) do { } while(0)
#endif

namespace antsim::core {

using colony_id_t    = ANTSIM_COLONY_ID_T;
using agent_id_t     = ANTSIM_AGENT_ID_T;
using direction_id_t = std::uint32_t;
using tick_t         = std::uint64_t;

// "no colony" marker for removed agents and failed lookups
inline constexpr colony_id_t kNoColony = std::numeric_limits<colony_id_t>::max();

namespace config {
// Defaults mirrored by the CLI. max_ticks bounds runs that never collide
// (pure cycles); max_moves caps each agent's walk.
inline constexpr std::uint64_t default_max_ticks = 100000;
inline constexpr std::uint64_t default_max_moves = 10000;
// Below this many movers the move phase runs inline instead of through TBB.
inline constexpr std::size_t   default_parallel_grain = 2048;
} // namespace config

} // namespace antsim::core
