// map_parser.hpp: map text -> ColonyGraph
#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "antsim/graphs/colony_graph.hpp"

namespace antsim::io {

/*
Format, one colony per line:
    Name dir1=Target1 dir2=Target2 ...
- Tokens are whitespace separated; blank lines and lines starting with '#'
  are skipped.
- Targets that never get a line of their own are created implicitly.
- A repeated direction on one line keeps the last target.
Throws MapParseError (with the 1-based line) for a token without '=', an
empty direction or target, or a colony defined on two lines.
*/
graphs::ColonyGraph parse_map(std::istream& in);
graphs::ColonyGraph parse_map_string(const std::string& text);

// Throws MapParseError when the file cannot be opened or read.
graphs::ColonyGraph load_map_file(const std::filesystem::path& path);

} // namespace antsim::io
