#pragma once
#include "Map.hpp"
#include "Types.hpp"

namespace holofit {

/*
 * Rewrite every SlotRef(i) of a map to SlotRef(renumber[i]).  Constants
 * and the shape of the tree are left alone.  Used right after
 * ParameterRegistry::merge() on every map of a model.
 */
Map retarget_map(const Map& map, const Renumbering& renumber);

/* in-place variant of the above */
void retarget_map_in_place(Map& map, const Renumbering& renumber);

} // namespace holofit
