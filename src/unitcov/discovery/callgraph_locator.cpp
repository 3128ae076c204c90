#include "callgraph_locator.hpp"

#include <algorithm>

#include <redlog.hpp>

namespace unitcov::discovery {

namespace {

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace

std::string relative_to_root(std::string_view path, std::string_view root) {
  std::string prefix(root);
  if (prefix.empty()) {
    return std::string(path);
  }
  if (prefix.back() != '/') {
    prefix += '/';
  }
  if (path.substr(0, prefix.size()) == prefix) {
    return std::string(path.substr(prefix.size()));
  }
  return std::string(path);
}

bool is_candidate_callgraph(const std::filesystem::path& path) {
  std::string name = path.filename().string();
  if (ends_with(name, "_test.ci")) {
    return false;
  }
  if (name.find("_test_la-") != std::string::npos) {
    return false;
  }
  if (path.generic_string().find("/.libs/") != std::string::npos) {
    return false;
  }
  return true;
}

callgraph_locator callgraph_locator::scan(const std::filesystem::path& root) {
  auto log = redlog::get_logger("unitcov.discovery");

  std::filesystem::path absolute_root = std::filesystem::absolute(root).lexically_normal();
  std::vector<std::string> found;

  for (const auto& entry : std::filesystem::recursive_directory_iterator(absolute_root)) {
    if (!entry.is_regular_file() || entry.path().extension() != callgraph_extension) {
      continue;
    }
    if (!is_candidate_callgraph(entry.path())) {
      log.ped("skipping call graph", redlog::field("path", entry.path().string()));
      continue;
    }
    found.push_back(entry.path().lexically_relative(absolute_root).generic_string());
  }

  std::sort(found.begin(), found.end());
  log.dbg("found call graphs", redlog::field("root", absolute_root.string()), redlog::field("count", found.size()));
  return callgraph_locator(std::move(found));
}

std::optional<std::string> callgraph_locator::find(std::string_view source_path) const {
  std::filesystem::path source(source_path);
  std::string source_dir = source.parent_path().generic_string();
  std::string suffix = "-" + source.stem().string() + std::string(callgraph_extension);

  for (const auto& candidate : callgraphs_) {
    std::filesystem::path path(candidate);
    if (path.parent_path().generic_string() != source_dir) {
      continue;
    }
    if (ends_with(path.filename().string(), suffix)) {
      return candidate;
    }
  }

  return std::nullopt;
}

} // namespace unitcov::discovery
