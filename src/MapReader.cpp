#include "holofit/MapReader.hpp"
#include "holofit/Errors.hpp"
#include <stdexcept>
#include <string>

namespace holofit {

namespace {

Value make_dict(const std::vector<std::string>& keys, List args)
{
    Dict d;
    d.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i)
        d.push_back({keys[i], std::move(args[i])});
    return d;
}

Value make_array(const std::string& dim, const std::vector<std::string>& coords, List args)
{
    return LabelledArray{dim, coords, std::move(args)};
}

ComplexPart to_part(const Value& v)
{
    if (v.is_parameter()) return v.as<PriorPtr>();
    return v.to_double();
}

/* numbers give a complex number, a free part keeps the pair symbolic */
Value make_complex(const Value& re, const Value& im)
{
    if (re.is_parameter() || im.is_parameter())
        return ComplexPair{to_part(re), to_part(im)};
    return std::complex<double>(re.to_double(), im.to_double());
}

void check_slot(std::size_t index, std::size_t available)
{
    if (index >= available)
        throw std::out_of_range("map references slot " + std::to_string(index) +
                                " but only " + std::to_string(available) +
                                " values were supplied");
}

struct VectorSlots {
    const Vector& values;
    Value operator()(std::size_t i) const
    {
        check_slot(i, static_cast<std::size_t>(values.size()));
        return values[static_cast<Eigen::Index>(i)];
    }
};

struct PriorSlots {
    const std::vector<PriorPtr>& slots;
    Value operator()(std::size_t i) const
    {
        check_slot(i, slots.size());
        if (!slots[i]) throw MissingParameter("slot " + std::to_string(i) + " is unresolved");
        return slots[i];
    }
};

template <typename Slots>
Value read_node(const Map& map, const Slots& slot)
{
    return std::visit([&](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Constant>) {
            return n.value;
        } else if constexpr (std::is_same_v<T, SlotRef>) {
            return slot(n.index);
        } else if constexpr (std::is_same_v<T, Sequence>) {
            List out;
            out.reserve(n.items.size());
            for (const auto& it : n.items) out.push_back(read_node(it, slot));
            return out;
        } else {
            List args;
            args.reserve(n.args.size());
            for (const auto& a : n.args) args.push_back(read_node(a, slot));
            return construct(n, std::move(args));
        }
    }, map.node());
}

} // namespace

Value construct(const Apply& node, List args)
{
    switch (node.ctor) {
    case Ctor::Dict:
        if (node.keys.size() != args.size())
            throw std::invalid_argument("dict constructor: key/argument count mismatch");
        return make_dict(node.keys, std::move(args));
    case Ctor::Array:
        if (node.keys.size() != args.size())
            throw std::invalid_argument("array constructor: coordinate/argument count mismatch");
        return make_array(node.dim, node.keys, std::move(args));
    case Ctor::Complex:
        if (args.size() != 2)
            throw std::invalid_argument("complex constructor takes two arguments");
        return make_complex(args[0], args[1]);
    }
    throw std::invalid_argument("unknown constructor");
}

Value read_map(const Map& map, const Vector& values)
{
    return read_node(map, VectorSlots{values});
}

Value read_map(const Map& map, const std::vector<PriorPtr>& slots)
{
    return read_node(map, PriorSlots{slots});
}

} // namespace holofit
