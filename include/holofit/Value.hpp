#pragma once
/*
 * Nested configuration values: the things a model is described with
 * (scatterer parameters, optics, model extras) and the things the map
 * reader hands back.  A value is null (the "absent" marker), a scalar,
 * a complex number, a reference to a free parameter, or one of the
 * containers
 *
 *      List           ordered items
 *      Dict           string keys, insertion order kept
 *      LabelledArray  one named axis, one item per coordinate label;
 *                     items are scalars (1-D) or further values (n-D)
 *      ComplexPair    real/imag parts of which at least one is free
 *
 * Equality is deep; priors compare by identity.
 */

#include "Prior.hpp"
#include <complex>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace holofit {

class Value;
struct DictEntry;

using List = std::vector<Value>;
using Dict = std::vector<DictEntry>;

struct LabelledArray {
    std::string              dim;
    std::vector<std::string> coords;
    List                     items;
};

using ComplexPart = std::variant<double, PriorPtr>;

struct ComplexPair {
    ComplexPart real;
    ComplexPart imag;
};

class Value {
public:
    enum class Kind {
        Null, Bool, Int, Float, String, Complex,
        Parameter, List, Dict, Array, ComplexPair
    };

    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 std::complex<double>,
                                 PriorPtr,
                                 List,
                                 Dict,
                                 LabelledArray,
                                 ComplexPair>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b)                 : v_(std::in_place_type<bool>, b) {}
    Value(int i)                  : v_(std::in_place_type<std::int64_t>, i) {}
    Value(std::int64_t i)         : v_(std::in_place_type<std::int64_t>, i) {}
    Value(double x)               : v_(std::in_place_type<double>, x) {}
    Value(const char* s)          : v_(std::in_place_type<std::string>, s) {}
    Value(std::string s)          : v_(std::in_place_type<std::string>, std::move(s)) {}
    Value(std::complex<double> c) : v_(std::in_place_type<std::complex<double>>, c) {}
    Value(List l)                 : v_(std::in_place_type<List>, std::move(l)) {}
    Value(Dict d);
    Value(LabelledArray a)        : v_(std::in_place_type<LabelledArray>, std::move(a)) {}
    Value(ComplexPair c)          : v_(std::in_place_type<ComplexPair>, std::move(c)) {}

    /* accepts shared_ptr<Uniform>, shared_ptr<const Gaussian>, ... */
    template <typename P,
              std::enable_if_t<std::is_convertible_v<std::shared_ptr<P>, PriorPtr>, int> = 0>
    Value(std::shared_ptr<P> p) : v_(std::in_place_type<PriorPtr>, std::move(p)) {}

    Kind kind() const { return static_cast<Kind>(v_.index()); }

    bool is_null()      const { return kind() == Kind::Null; }
    bool is_number()    const { return kind() == Kind::Int || kind() == Kind::Float; }
    bool is_parameter() const { return kind() == Kind::Parameter; }

    template <typename T> const T& as() const { return std::get<T>(v_); }
    template <typename T> const T* get_if() const { return std::get_if<T>(&v_); }

    /* Int or Float as double; throws std::invalid_argument otherwise */
    double to_double() const;

    /* Dict lookup; nullptr when this is not a Dict or the key is absent */
    const Value* find(const std::string& key) const;

    const Storage& storage() const { return v_; }

private:
    Storage v_;
};

struct DictEntry {
    std::string key;
    Value       value;
};

const Value* find(const Dict& dict, const std::string& key);

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);
bool operator==(const DictEntry& a, const DictEntry& b);
bool operator==(const LabelledArray& a, const LabelledArray& b);
bool operator==(const ComplexPair& a, const ComplexPair& b);

std::ostream& operator<<(std::ostream& os, const Value& v);
std::string to_string(const Value& v);

} // namespace holofit
