#pragma once
#include "Map.hpp"
#include "Prior.hpp"
#include "Types.hpp"
#include "Value.hpp"
#include <vector>

namespace holofit {

/*
 * Evaluate a map against concrete slot values.  Pure; safe to call from
 * many threads at once on the same map.  A slot index beyond the end of
 * `values` throws std::out_of_range.
 */
Value read_map(const Map& map, const Vector& values);

/*
 * Evaluate a map with the priors themselves in the slots, giving back the
 * configuration as it was described.  A null entry is a slot that was
 * never resolved (a recipe loaded without its parameters) and throws
 * MissingParameter.
 */
Value read_map(const Map& map, const std::vector<PriorPtr>& slots);

/* the closed set of constructors an Apply node may name */
Value construct(const Apply& node, List args);

} // namespace holofit
