#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "unitcov/callgraph/call_graph.hpp"

namespace unitcov::callgraph {

// target name gcc uses for calls through a pointer
constexpr std::string_view indirect_call_target = "__indirect_call";

// "unit:name" -> "name"; unqualified names are returned unchanged
std::string strip_unit_qualifier(std::string_view name);

/**
 * @brief Builds a call graph from gcc -fcallgraph-info output (.ci files, VCG syntax)
 *
 * Reads `edge: { sourcename: "a" targetname: "b" ... }` lines into caller -> callee edges and
 * `node: { title: "a" ... }` lines into nodes. Edges to the indirect call target are dropped
 * and lines that do not match are skipped.
 */
call_graph parse_callgraph(std::istream& input);

// throws unitcov::error(io_error) if the file cannot be opened
call_graph read_callgraph(const std::string& path);

} // namespace unitcov::callgraph
