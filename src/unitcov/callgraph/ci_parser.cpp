#include "ci_parser.hpp"

#include <fstream>
#include <istream>
#include <regex>

#include <redlog.hpp>

#include "unitcov/error.hpp"

namespace unitcov::callgraph {

namespace {
const std::regex edge_pattern(R"re(sourcename: "([^"]+)" targetname: "([^"]+)")re");
const std::regex node_pattern(R"re(title: "([^"]+)")re");
} // namespace

std::string strip_unit_qualifier(std::string_view name) {
  size_t colon = name.find(':');
  if (colon == std::string_view::npos) {
    return std::string(name);
  }

  std::string_view rest = name.substr(colon + 1);
  size_t next = rest.find(':');
  return std::string(next == std::string_view::npos ? rest : rest.substr(0, next));
}

call_graph parse_callgraph(std::istream& input) {
  auto log = redlog::get_logger("unitcov.callgraph");

  call_graph graph;
  size_t skipped = 0;
  size_t indirect = 0;
  std::string line;
  std::smatch match;

  while (std::getline(input, line)) {
    if (line.rfind("edge:", 0) == 0) {
      if (!std::regex_search(line, match, edge_pattern)) {
        ++skipped;
        continue;
      }
      if (match[2].str() == indirect_call_target) {
        ++indirect;
        continue;
      }
      graph.add_edge(strip_unit_qualifier(match[1].str()), strip_unit_qualifier(match[2].str()));
    } else if (line.rfind("node:", 0) == 0) {
      if (std::regex_search(line, match, node_pattern)) {
        graph.add_node(strip_unit_qualifier(match[1].str()));
      }
    }
  }

  if (input.bad()) {
    throw error(error_code::io_error, "error reading call graph");
  }

  log.trc(
      "parsed call graph", redlog::field("nodes", graph.node_count()), redlog::field("edges", graph.edge_count()),
      redlog::field("indirect", indirect), redlog::field("skipped", skipped)
  );
  return graph;
}

call_graph read_callgraph(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw error(error_code::io_error, "cannot open call graph: " + path);
  }

  auto log = redlog::get_logger("unitcov.callgraph");
  log.dbg("reading call graph", redlog::field("path", path));
  return parse_callgraph(file);
}

} // namespace unitcov::callgraph
