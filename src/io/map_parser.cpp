#include "antsim/io/map_parser.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

#include "antsim/core/errors.hpp"
#include "antsim/core/log.hpp"

namespace antsim::io {
namespace {

struct Link {
    std::string direction;
    std::string target;
};

// Splits "dir=Target" at the first '='.
Link split_link(const std::string& token, std::size_t line_no) {
    const auto peq = token.find('=');
    if (peq == std::string::npos) {
        throw MapParseError(line_no, "expected direction=target, got '" + token + "'");
    }
    Link l{token.substr(0, peq), token.substr(peq + 1)};
    if (l.direction.empty()) throw MapParseError(line_no, "empty direction in '" + token + "'");
    if (l.target.empty())    throw MapParseError(line_no, "empty target in '" + token + "'");
    return l;
}

} // namespace

graphs::ColonyGraph parse_map(std::istream& in) {
    graphs::ColonyGraph g;
    std::unordered_set<std::string> defined;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::istringstream ls(line);
        std::string name;
        if (!(ls >> name)) continue;   // blank
        if (name.front() == '#') continue;

        if (name.find('=') != std::string::npos) {
            throw MapParseError(line_no, "line must start with a colony name, got '" + name + "'");
        }
        if (!defined.insert(name).second) {
            throw MapParseError(line_no, "colony '" + name + "' defined twice");
        }

        // Validate the whole line before touching the graph.
        std::vector<Link> links;
        for (std::string token; ls >> token;) links.push_back(split_link(token, line_no));

        const auto from = g.add_colony(name);
        for (const Link& l : links) {
            const auto to = g.add_colony(l.target);
            g.add_edge(from, l.direction, to);
        }
    }
    if (in.bad()) throw MapParseError(line_no, "read error");

    log::debug("map: " + std::to_string(g.colony_count()) + " colonies, "
               + std::to_string(g.edge_count()) + " tunnels (" + std::to_string(defined.size())
               + " defined explicitly)");
    return g;
}

graphs::ColonyGraph parse_map_string(const std::string& text) {
    std::istringstream in(text);
    return parse_map(in);
}

graphs::ColonyGraph load_map_file(const std::filesystem::path& path) {
    std::ifstream fin(path);
    if (!fin) throw MapParseError(0, "cannot open map file '" + path.string() + "'");
    return parse_map(fin);
}

} // namespace antsim::io
