#pragma once
/*
 * A Map is the recipe that turns a flat parameter vector back into a
 * nested configuration value.  It is a tree of four node kinds:
 *
 *      Constant(value)       fixed leaf, returned verbatim
 *      SlotRef(i)            values[i]
 *      Sequence(items)       ordered list of sub-maps
 *      Apply(ctor, args)     one of a closed set of constructors applied
 *                            to the evaluated args
 *
 * Constructors are identified by tag, never by code, so a map can be
 * written to JSON and read back.  The same SlotRef may occur any number
 * of times; that is how tied parameters are represented.
 */

#include "Types.hpp"
#include "Value.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace holofit {

class Map;

enum class Ctor {
    Dict,       // keys[i] ↦ args[i]
    Array,      // labelled array along `dim`, coordinate keys[i] ↦ args[i]
    Complex     // args = {real, imag}
};

struct Constant {
    Value value;
};

struct SlotRef {
    std::size_t index;
};

struct Sequence {
    std::vector<Map> items;
};

struct Apply {
    Ctor                     ctor;
    std::string              dim;     // Array only
    std::vector<std::string> keys;    // Dict keys / Array coordinate labels
    std::vector<Map>         args;
};

class Map {
public:
    using Node = std::variant<Constant, SlotRef, Sequence, Apply>;

    Map() : node_(std::in_place_type<Constant>) {}
    Map(Constant c);
    Map(SlotRef s);
    Map(Sequence s);
    Map(Apply a);

    const Node& node() const { return node_; }
    Node&       node()       { return node_; }

    /* Constant(null): an omitted optional value */
    bool is_absent() const;

private:
    Node node_;
};

bool operator==(const Map& a, const Map& b);
bool operator!=(const Map& a, const Map& b);

/* every slot index referenced, in depth-first order (duplicates kept) */
std::vector<std::size_t> slot_references(const Map& map);

std::string to_string(Ctor ctor);
Ctor ctor_from_string(const std::string& tag);

/* ------------------------------------------------------------------------- */
/*  JSON (nlohmann ADL hooks)                                                */
/* ------------------------------------------------------------------------- */
void to_json(nlohmann::json& j, const Map& map);
void from_json(const nlohmann::json& j, Map& map);

/* constant payloads; a Value holding a prior cannot be a constant */
nlohmann::json value_to_json(const Value& v);
Value value_from_json(const nlohmann::json& j);

} // namespace holofit
