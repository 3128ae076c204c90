#pragma once

#include <functional>
#include <set>
#include <string>

namespace unitcov {

// sorted set of function names, searchable by string_view
using name_set = std::set<std::string, std::less<>>;

} // namespace unitcov
