#include "restricted_functions.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

#include <redlog.hpp>

#include "unitcov/error.hpp"
#include "unitcov/util/string_utils.hpp"

namespace unitcov::discovery {

std::optional<std::string> function_name_from_declaration(std::string_view line) {
  size_t paren = line.find('(');
  if (paren == std::string_view::npos) {
    return std::nullopt;
  }

  // probably a variable with an initializer
  if (line.find('=') != std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view head = line.substr(0, paren);
  size_t space = head.rfind(' ');
  if (space != std::string_view::npos) {
    head = head.substr(space + 1);
  }

  std::string name;
  std::copy_if(head.begin(), head.end(), std::back_inserter(name), util::is_identifier_char);
  if (name.empty()) {
    return std::nullopt;
  }
  return name;
}

void collect_restricted_functions(std::istream& source, name_set& out) {
  std::string line;
  bool previous_static = false;

  while (std::getline(source, line)) {
    bool is_static = line.rfind("static", 0) == 0;
    if (is_static || previous_static) {
      if (auto name = function_name_from_declaration(line)) {
        out.insert(std::move(*name));
      }
    }
    previous_static = is_static;
  }
}

name_set discover_restricted_functions(const std::filesystem::path& lib_dir) {
  auto log = redlog::get_logger("unitcov.discovery");

  name_set restricted;

  std::error_code ec;
  if (!std::filesystem::is_directory(lib_dir, ec)) {
    log.warn("library directory not found, no functions treated as static", redlog::field("path", lib_dir.string()));
    return restricted;
  }

  std::vector<std::filesystem::path> sources;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(lib_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto extension = entry.path().extension();
    if (extension == ".c" || extension == ".h") {
      sources.push_back(entry.path());
    }
  }
  std::sort(sources.begin(), sources.end());

  for (const auto& path : sources) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw error(error_code::io_error, "cannot open source file: " + path.string());
    }
    collect_restricted_functions(file, restricted);
  }

  log.dbg(
      "discovered static functions", redlog::field("files", sources.size()),
      redlog::field("functions", restricted.size())
  );
  return restricted;
}

} // namespace unitcov::discovery
