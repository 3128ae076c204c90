#pragma once

#include "unitcov/lcov/function_extractor.hpp"
#include "unitcov/lcov/record.hpp"

namespace unitcov::lcov {

/**
 * @brief Returns a copy of record with the coverage of one function removed
 *
 * The FNDA count of span.name and the count of every DA line inside the span become 0.
 * FNH drops by one if the function had been hit, LH drops by the number of hit lines that
 * were zeroed, so both aggregates keep matching the detail lines. Erasing a function that
 * is already at zero returns an identical record.
 *
 * Throws unitcov::error(inconsistent_aggregate) if an aggregate would become negative.
 */
coverage_record erase_function(const coverage_record& record, const function_span& span);

} // namespace unitcov::lcov
