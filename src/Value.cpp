#include "holofit/Value.hpp"
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace holofit {

Value::Value(Dict d) : v_(std::in_place_type<Dict>, std::move(d)) {}

double Value::to_double() const
{
    if (const auto* i = get_if<std::int64_t>()) return static_cast<double>(*i);
    if (const auto* x = get_if<double>())       return *x;
    throw std::invalid_argument("expected a number, got " + to_string(*this));
}

const Value* Value::find(const std::string& key) const
{
    const auto* d = get_if<Dict>();
    return d ? holofit::find(*d, key) : nullptr;
}

const Value* find(const Dict& dict, const std::string& key)
{
    for (const auto& e : dict)
        if (e.key == key) return &e.value;
    return nullptr;
}

/* ------------------------------------------------------------------------- */
/*  deep equality                                                            */
/* ------------------------------------------------------------------------- */
bool operator==(const Value& a, const Value& b)       { return a.storage() == b.storage(); }
bool operator!=(const Value& a, const Value& b)       { return !(a == b); }
bool operator==(const DictEntry& a, const DictEntry& b) { return a.key == b.key && a.value == b.value; }

bool operator==(const LabelledArray& a, const LabelledArray& b)
{
    return a.dim == b.dim && a.coords == b.coords && a.items == b.items;
}

bool operator==(const ComplexPair& a, const ComplexPair& b)
{
    return a.real == b.real && a.imag == b.imag;
}

/* ------------------------------------------------------------------------- */
/*  printing                                                                 */
/* ------------------------------------------------------------------------- */
namespace {

void print_part(std::ostream& os, const ComplexPart& p)
{
    if (const auto* x = std::get_if<double>(&p)) os << *x;
    else os << std::get<PriorPtr>(p)->describe();
}

template <typename Seq>
void print_items(std::ostream& os, const Seq& items)
{
    bool first = true;
    for (const auto& it : items) {
        if (!first) os << ", ";
        os << it;
        first = false;
    }
}

} // namespace

std::ostream& operator<<(std::ostream& os, const Value& v)
{
    switch (v.kind()) {
    case Value::Kind::Null:    os << "null"; break;
    case Value::Kind::Bool:    os << (v.as<bool>() ? "true" : "false"); break;
    case Value::Kind::Int:     os << v.as<std::int64_t>(); break;
    case Value::Kind::Float:   os << v.as<double>(); break;
    case Value::Kind::String:  os << '"' << v.as<std::string>() << '"'; break;
    case Value::Kind::Complex: {
        const auto c = v.as<std::complex<double>>();
        os << '(' << c.real() << (c.imag() < 0 ? "-" : "+") << std::abs(c.imag()) << "j)";
        break;
    }
    case Value::Kind::Parameter: {
        const auto& p = v.as<PriorPtr>();
        os << (p ? p->describe() : std::string("<unresolved>"));
        break;
    }
    case Value::Kind::List:
        os << '[';
        print_items(os, v.as<List>());
        os << ']';
        break;
    case Value::Kind::Dict: {
        os << '{';
        bool first = true;
        for (const auto& e : v.as<Dict>()) {
            if (!first) os << ", ";
            os << e.key << ": " << e.value;
            first = false;
        }
        os << '}';
        break;
    }
    case Value::Kind::Array: {
        const auto& a = v.as<LabelledArray>();
        os << a.dim << '[';
        for (std::size_t i = 0; i < a.items.size(); ++i) {
            if (i) os << ", ";
            os << (i < a.coords.size() ? a.coords[i] : "?") << ": " << a.items[i];
        }
        os << ']';
        break;
    }
    case Value::Kind::ComplexPair: {
        const auto& c = v.as<ComplexPair>();
        os << "complex(";
        print_part(os, c.real);
        os << ", ";
        print_part(os, c.imag);
        os << ')';
        break;
    }
    }
    return os;
}

std::string to_string(const Value& v)
{
    std::ostringstream os;
    os << v;
    return os.str();
}

} // namespace holofit
