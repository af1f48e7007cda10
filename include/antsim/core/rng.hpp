#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <random>
#include <thread>

namespace antsim::core {

// SplitMix64 finalizer. Used both as the engine step and as a seed hash.
inline constexpr std::uint64_t mix64(std::uint64_t z) noexcept {
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// Simple SplitMix64 PRNG (fast, stateless stepping), usable as a URBG.
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() noexcept {
        return mix64(state += 0x9E3779B97F4A7C15ULL);
    }
    inline result_type operator()() noexcept { return next_u64(); }
};

inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    return mix64(x + 0x9E3779B97F4A7C15ULL);
}

// Seed for an independent stream keyed by (seed, a, b). The engine uses
// (tick, agent) so each agent's draw in a tick is fixed regardless of which
// worker evaluates it.
inline std::uint64_t stream_seed(std::uint64_t seed, std::uint64_t a, std::uint64_t b) noexcept {
    std::uint64_t h = splitmix_hash(seed);
    h = splitmix_hash(h ^ a);
    return splitmix_hash(h ^ (b * 0xD1B54A32D192ED03ULL));
}

// Unbiased mapping of a 64-bit URBG output to [0, n) using Lemire's
// multiply-high method with a tiny rejection loop. Preconditions: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) noexcept {
    using u128 = unsigned __int128;
    std::uint64_t x = rng();
    u128 m = (u128)x * (u128)n;
    std::uint64_t l = (std::uint64_t)m;
    if (l < n) {
        const std::uint64_t t = (-n) % n;
        while (l < t) { x = rng(); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
    }
    return (std::uint64_t)(m >> 64);
}

// Best-effort nondeterministic seed for "--seed auto".
inline std::uint64_t make_random_seed() {
    std::uint64_t s = 0;
    std::random_device rd;
    s ^= splitmix_hash((std::uint64_t(rd()) << 32) ^ std::uint64_t(rd()));
    const auto t = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    s ^= splitmix_hash(t);
    s ^= splitmix_hash(static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id())));
    if (s == 0) s = 0x9E3779B97F4A7C15ULL;
    return s;
}

} // namespace antsim::core
