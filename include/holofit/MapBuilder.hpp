#pragma once
#include "Map.hpp"
#include "ParameterRegistry.hpp"
#include "Value.hpp"
#include <string>

namespace holofit {

/*
 * Walks a nested configuration value and records how to rebuild it.
 * Free parameters met on the way are registered under a dotted name
 * derived from their position ("center.0", "n.imag", ...).
 *
 * Dispatch order:  List, Dict, LabelledArray, ComplexPair (containers)
 *                  → prior  → anything else is a Constant.
 */
class MapBuilder {
public:
    explicit MapBuilder(ParameterRegistry& registry) : registry_(registry) {}

    Map build(const Value& value, const std::string& name_prefix = "");

private:
    Map build_list_(const List& items, const std::string& prefix);
    Map build_dict_(const Dict& dict, const std::string& prefix);
    Map build_array_(const LabelledArray& array, const std::string& prefix);
    Map build_complex_(const ComplexPair& pair, const std::string& prefix);

    ParameterRegistry& registry_;
};

} // namespace holofit
