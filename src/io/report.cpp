#include "antsim/io/report.hpp"

#include <iomanip>
#include <sstream>

namespace antsim::io {

std::string format_event(const sim::DestructionEvent& ev) {
    std::ostringstream os;
    os << ev.colony << " has been destroyed by ";
    const std::size_t n = ev.agents.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) os << (i + 1 == n ? " and " : ", ");
        os << "ant " << ev.agents[i];
    }
    os << "!";
    return os.str();
}

void write_event(std::ostream& os, const sim::DestructionEvent& ev) {
    os << format_event(ev) << "\n";
}

void write_remaining_map(std::ostream& os, const graphs::ColonyGraph& graph) {
    graph.for_each_colony([&](graphs::colony_id_t c) {
        os << graph.name(c);
        for (const graphs::Edge& e : graph.neighbors(c)) {
            os << ' ' << graph.direction_name(e.direction) << '=' << graph.name(e.target);
        }
        os << '\n';
    });
}

void write_summary(std::ostream& os, const sim::RunResult& r, double seconds) {
    os << "\nSimulation completed in " << std::fixed << std::setprecision(3) << seconds << "s"
       << std::defaultfloat << " after " << r.ticks << " ticks (" << sim::to_string(r.reason) << ")\n"
       << "Colonies destroyed: " << r.colonies_destroyed() << " of " << r.initial_colonies << "\n"
       << "Ants remaining: " << r.surviving_agents << " of " << r.initial_agents << "\n";
}

void write_batch_summary(std::ostream& os, const sim::BatchTotals& t, double seconds) {
    os << "Runs: " << t.runs << " in " << std::fixed << std::setprecision(3) << seconds << "s\n"
       << std::setprecision(2)
       << "Average ticks: " << t.mean(t.ticks) << " (max " << t.max_ticks_seen << ")\n"
       << "Average colonies destroyed: " << t.mean(t.colonies_destroyed) << "\n"
       << "Average ants destroyed: " << t.mean(t.agents_destroyed) << "\n"
       << "Average ants remaining: " << t.mean(t.surviving_agents) << "\n"
       << "Runs stopped by tick limit: " << t.tick_limited << "\n"
       << std::defaultfloat;
}

} // namespace antsim::io
