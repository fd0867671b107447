#include "holofit/Map.hpp"
#include "holofit/Errors.hpp"
#include "holofit/JsonUtils.hpp"
#include <cmath>

namespace holofit {

Map::Map(Constant c) : node_(std::in_place_type<Constant>, std::move(c)) {}
Map::Map(SlotRef s)  : node_(std::in_place_type<SlotRef>, s) {}
Map::Map(Sequence s) : node_(std::in_place_type<Sequence>, std::move(s)) {}
Map::Map(Apply a)    : node_(std::in_place_type<Apply>, std::move(a)) {}

bool Map::is_absent() const
{
    const auto* c = std::get_if<Constant>(&node_);
    return c && c->value.is_null();
}

/* ------------------------------------------------------------------------- */
/*  structural equality                                                      */
/* ------------------------------------------------------------------------- */
namespace {

struct NodeEqual {
    bool operator()(const Constant& a, const Constant& b) const { return a.value == b.value; }
    bool operator()(const SlotRef& a, const SlotRef& b) const   { return a.index == b.index; }
    bool operator()(const Sequence& a, const Sequence& b) const { return a.items == b.items; }
    bool operator()(const Apply& a, const Apply& b) const
    {
        return a.ctor == b.ctor && a.dim == b.dim && a.keys == b.keys && a.args == b.args;
    }
    template <typename A, typename B>
    bool operator()(const A&, const B&) const { return false; }
};

void collect_slots(const Map& map, std::vector<std::size_t>& out)
{
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, SlotRef>) {
            out.push_back(n.index);
        } else if constexpr (std::is_same_v<T, Sequence>) {
            for (const auto& it : n.items) collect_slots(it, out);
        } else if constexpr (std::is_same_v<T, Apply>) {
            for (const auto& a : n.args) collect_slots(a, out);
        }
    }, map.node());
}

} // namespace

bool operator==(const Map& a, const Map& b) { return std::visit(NodeEqual{}, a.node(), b.node()); }
bool operator!=(const Map& a, const Map& b) { return !(a == b); }

std::vector<std::size_t> slot_references(const Map& map)
{
    std::vector<std::size_t> out;
    collect_slots(map, out);
    return out;
}

std::string to_string(Ctor ctor)
{
    switch (ctor) {
    case Ctor::Dict:    return "dict";
    case Ctor::Array:   return "array";
    case Ctor::Complex: return "complex";
    }
    throw SerializationError("invalid constructor tag");
}

Ctor ctor_from_string(const std::string& tag)
{
    if (tag == "dict")    return Ctor::Dict;
    if (tag == "array")   return Ctor::Array;
    if (tag == "complex") return Ctor::Complex;
    throw SerializationError("unknown constructor tag '" + tag + "'");
}

/* ------------------------------------------------------------------------- */
/*  constant payloads                                                        */
/* ------------------------------------------------------------------------- */
nlohmann::json value_to_json(const Value& v)
{
    using nlohmann::json;
    switch (v.kind()) {
    case Value::Kind::Null:   return nullptr;
    case Value::Kind::Bool:   return v.as<bool>();
    case Value::Kind::Int:    return v.as<std::int64_t>();
    case Value::Kind::String: return v.as<std::string>();
    case Value::Kind::Float: {
        const double x = v.as<double>();
        if (std::isfinite(x)) return x;
        return json{{"float", real_to_json(x)}};
    }
    case Value::Kind::Complex: {
        const auto c = v.as<std::complex<double>>();
        return json{{"complex", json::array({real_to_json(c.real()), real_to_json(c.imag())})}};
    }
    case Value::Kind::List: {
        json arr = json::array();
        for (const auto& it : v.as<List>()) arr.push_back(value_to_json(it));
        return arr;
    }
    case Value::Kind::Dict: {
        json entries = json::array();
        for (const auto& e : v.as<Dict>())
            entries.push_back(json::array({e.key, value_to_json(e.value)}));
        return json{{"dict", entries}};
    }
    case Value::Kind::Array: {
        const auto& a = v.as<LabelledArray>();
        json items = json::array();
        for (const auto& it : a.items) items.push_back(value_to_json(it));
        return json{{"labelled_array",
                     json{{"dim", a.dim}, {"coords", a.coords}, {"items", items}}}};
    }
    case Value::Kind::Parameter:
    case Value::Kind::ComplexPair:
        break;
    }
    throw SerializationError("free parameters cannot be stored as constants: " + to_string(v));
}

Value value_from_json(const nlohmann::json& j)
{
    if (j.is_null())            return Value();
    if (j.is_boolean())         return Value(j.get<bool>());
    if (j.is_number_integer())  return Value(j.get<std::int64_t>());
    if (j.is_number_float())    return Value(j.get<double>());
    if (j.is_string())          return Value(j.get<std::string>());
    if (j.is_array()) {
        List items;
        for (const auto& it : j) items.push_back(value_from_json(it));
        return Value(std::move(items));
    }
    if (j.is_object() && j.size() == 1) {
        if (j.contains("float"))
            return Value(real_from_json(j["float"]));
        if (j.contains("complex")) {
            const auto& c = j["complex"];
            if (!c.is_array() || c.size() != 2)
                throw SerializationError("complex constant needs [real, imag]");
            return Value(std::complex<double>(real_from_json(c[0]), real_from_json(c[1])));
        }
        if (j.contains("dict")) {
            Dict d;
            for (const auto& e : j["dict"]) {
                if (!e.is_array() || e.size() != 2 || !e[0].is_string())
                    throw SerializationError("dict constant entries are [key, value]");
                d.push_back({e[0].get<std::string>(), value_from_json(e[1])});
            }
            return Value(std::move(d));
        }
        if (j.contains("labelled_array")) {
            const auto& a = j["labelled_array"];
            LabelledArray arr;
            arr.dim    = a.at("dim").get<std::string>();
            arr.coords = a.at("coords").get<std::vector<std::string>>();
            for (const auto& it : a.at("items")) arr.items.push_back(value_from_json(it));
            return Value(std::move(arr));
        }
    }
    throw SerializationError("unrecognised constant " + j.dump());
}

/* ------------------------------------------------------------------------- */
/*  map nodes                                                                */
/* ------------------------------------------------------------------------- */
void to_json(nlohmann::json& j, const Map& map)
{
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Constant>) {
            j = {{"kind", "constant"}, {"value", value_to_json(n.value)}};
        } else if constexpr (std::is_same_v<T, SlotRef>) {
            j = {{"kind", "slot"}, {"index", n.index}};
        } else if constexpr (std::is_same_v<T, Sequence>) {
            j = {{"kind", "sequence"}, {"items", n.items}};
        } else {
            j = {{"kind", "apply"}, {"ctor", to_string(n.ctor)}, {"args", n.args}};
            if (n.ctor != Ctor::Complex) j["keys"] = n.keys;
            if (n.ctor == Ctor::Array)   j["dim"]  = n.dim;
        }
    }, map.node());
}

void from_json(const nlohmann::json& j, Map& map)
{
    if (!j.is_object() || !j.contains("kind"))
        throw SerializationError("map node without \"kind\": " + j.dump());

    try {
        const auto kind = j["kind"].get<std::string>();
        if (kind == "constant") {
            map = Constant{value_from_json(j.at("value"))};
        } else if (kind == "slot") {
            map = SlotRef{j.at("index").get<std::size_t>()};
        } else if (kind == "sequence") {
            map = Sequence{j.at("items").get<std::vector<Map>>()};
        } else if (kind == "apply") {
            Apply a;
            a.ctor = ctor_from_string(j.at("ctor").get<std::string>());
            a.args = j.at("args").get<std::vector<Map>>();
            if (a.ctor != Ctor::Complex)
                a.keys = j.at("keys").get<std::vector<std::string>>();
            if (a.ctor == Ctor::Array)
                a.dim = j.at("dim").get<std::string>();

            if (a.ctor == Ctor::Complex && a.args.size() != 2)
                throw SerializationError("complex constructor takes exactly two arguments");
            if (a.ctor != Ctor::Complex && a.keys.size() != a.args.size())
                throw SerializationError(to_string(a.ctor) + " constructor: "
                                         "keys and arguments differ in length");
            map = std::move(a);
        } else {
            throw SerializationError("unknown map node kind '" + kind + "'");
        }
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(e.what());
    }
}

} // namespace holofit
