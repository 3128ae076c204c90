#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "unitcov/attribution/engine.hpp"
#include "unitcov/discovery/callgraph_locator.hpp"
#include "unitcov/lcov/record.hpp"
#include "unitcov/types.hpp"
#include "unitcov/unitcov_config.hpp"

namespace unitcov {

/**
 * @brief One run over one tracefile
 *
 * initialize() discovers the tested functions, the static functions and the call graphs
 * under the source root; run() then rewrites every record of a tracefile and writes it out
 * as soon as it is done, in input order.
 */
class session {
public:
  explicit session(unitcov_config config);

  void initialize();
  bool is_initialized() const noexcept { return initialized_; }

  // throws unitcov::error; records written before the failure stay written
  attribution::attribution_summary run(const std::string& tracefile, std::ostream& output);

  attribution::record_result process_record(const lcov::coverage_record& record) const;

  const name_set& tested_functions() const noexcept { return inputs_.tested; }
  const name_set& restricted_functions() const noexcept { return inputs_.restricted; }
  const discovery::callgraph_locator& locator() const noexcept { return locator_; }

private:
  unitcov_config config_;
  attribution::attribution_inputs inputs_;
  discovery::callgraph_locator locator_;
  std::unique_ptr<attribution::attribution_engine> engine_;
  bool initialized_ = false;
};

} // namespace unitcov
