#include "holofit/MapBuilder.hpp"
#include <stdexcept>

namespace holofit {

namespace {

Value part_value(const ComplexPart& part)
{
    if (const auto* x = std::get_if<double>(&part)) return Value(*x);
    return Value(std::get<PriorPtr>(part));
}

} // namespace

Map MapBuilder::build(const Value& value, const std::string& name_prefix)
{
    switch (value.kind()) {
    case Value::Kind::List:        return build_list_(value.as<List>(), name_prefix);
    case Value::Kind::Dict:        return build_dict_(value.as<Dict>(), name_prefix);
    case Value::Kind::Array:       return build_array_(value.as<LabelledArray>(), name_prefix);
    case Value::Kind::ComplexPair: return build_complex_(value.as<ComplexPair>(), name_prefix);
    case Value::Kind::Parameter:
        return SlotRef{registry_.register_parameter(value.as<PriorPtr>(), name_prefix)};
    default:
        return Constant{value};
    }
}

Map MapBuilder::build_list_(const List& items, const std::string& prefix)
{
    Sequence seq;
    seq.items.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
        seq.items.push_back(build(items[i], prefix + "." + std::to_string(i)));
    return seq;
}

Map MapBuilder::build_dict_(const Dict& dict, const std::string& prefix)
{
    const std::string sep = prefix.empty() ? "" : prefix + ".";

    Apply a{Ctor::Dict, {}, {}, {}};
    for (const auto& e : dict) {
        Map m = build(e.value, sep + e.key);
        if (m.is_absent()) continue;          // optional value left out
        a.keys.push_back(e.key);
        a.args.push_back(std::move(m));
    }
    return a;
}

Map MapBuilder::build_array_(const LabelledArray& array, const std::string& prefix)
{
    if (array.coords.size() != array.items.size())
        throw std::invalid_argument("labelled array '" + array.dim +
                                    "': coordinate count does not match item count");

    Apply a{Ctor::Array, array.dim, array.coords, {}};
    a.args.reserve(array.items.size());
    for (std::size_t i = 0; i < array.items.size(); ++i)
        a.args.push_back(build(array.items[i], prefix + "." + array.coords[i]));
    return a;
}

Map MapBuilder::build_complex_(const ComplexPair& pair, const std::string& prefix)
{
    const bool free_real = std::holds_alternative<PriorPtr>(pair.real);
    const bool free_imag = std::holds_alternative<PriorPtr>(pair.imag);
    if (!free_real && !free_imag)
        return Constant{Value(std::complex<double>(std::get<double>(pair.real),
                                                   std::get<double>(pair.imag)))};

    Apply a{Ctor::Complex, {}, {}, {}};
    a.args.push_back(build(part_value(pair.real), prefix + ".real"));
    a.args.push_back(build(part_value(pair.imag), prefix + ".imag"));
    return a;
}

} // namespace holofit
