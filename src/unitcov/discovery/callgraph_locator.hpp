#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unitcov::discovery {

constexpr std::string_view callgraph_extension = ".ci";

// path with a leading "<root>/" removed; other paths are returned unchanged
std::string relative_to_root(std::string_view path, std::string_view root);

// false for call graphs of unit test drivers, of the test builds of libraries and of libtool's .libs copies
bool is_candidate_callgraph(const std::filesystem::path& path);

/**
 * @brief Maps source files to the call graph gcc wrote for them
 *
 * Call graphs are named after the object file, e.g. lib/common/libcrmcommon_la-strings.ci for
 * lib/common/strings.c, so a call graph matches a source file when both live in the same
 * directory and the call graph's name ends in "-<source stem>.ci".
 */
class callgraph_locator {
public:
  callgraph_locator() = default;
  explicit callgraph_locator(std::vector<std::string> callgraphs) : callgraphs_(std::move(callgraphs)) {}

  // every candidate .ci file below root, as sorted root-relative paths
  static callgraph_locator scan(const std::filesystem::path& root);

  // source_path is relative to the same root as the call graphs; the first match wins
  std::optional<std::string> find(std::string_view source_path) const;

  const std::vector<std::string>& callgraphs() const noexcept { return callgraphs_; }

private:
  std::vector<std::string> callgraphs_;
};

} // namespace unitcov::discovery
