// report.hpp: human-readable output for events, final map and run summaries
#pragma once

#include <ostream>
#include <string>

#include "antsim/graphs/colony_graph.hpp"
#include "antsim/sim/batch.hpp"
#include "antsim/sim/engine.hpp"

namespace antsim::io {

// "Fizz has been destroyed by ant 0 and ant 1!"
std::string format_event(const sim::DestructionEvent& ev);
void write_event(std::ostream& os, const sim::DestructionEvent& ev);

// One live colony per line in load order, in map-file syntax, so the output
// can be fed back as a map.
void write_remaining_map(std::ostream& os, const graphs::ColonyGraph& graph);

void write_summary(std::ostream& os, const sim::RunResult& r, double seconds);
void write_batch_summary(std::ostream& os, const sim::BatchTotals& t, double seconds);

} // namespace antsim::io
