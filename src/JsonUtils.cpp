#include "holofit/JsonUtils.hpp"
#include "holofit/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>

namespace holofit {

namespace {

std::ifstream open_for_reading(const std::string& path)
{
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open " + path);
    return f;
}

/* ${VAR} -> value of VAR (empty if unset); substituted text is not rescanned */
std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out;
    auto tail = input.cbegin();
    for (std::sregex_iterator it(input.cbegin(), input.cend(), re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(tail, m[0].first);
        if (const char* env = std::getenv(m.str(1).c_str())) out += env;
        tail = m[0].second;
    }
    out.append(tail, input.cend());
    return out;
}

} // namespace

nlohmann::json load_json(const std::string& path)
{
    auto f = open_for_reading(path);
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

nlohmann::ordered_json load_ordered_json(const std::string& path)
{
    auto f = open_for_reading(path);
    try {
        return nlohmann::ordered_json::parse(f);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void save_json(const std::string& path, const nlohmann::json& j, int indent)
{
    std::ofstream f(path);
    if (!f) throw ConfigError("cannot write " + path);
    f << j.dump(indent) << '\n';
}

void expand_env(nlohmann::ordered_json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

std::string expand_env(const std::string& s)
{
    return expand(s);
}

nlohmann::json real_to_json(double x)
{
    if (std::isnan(x)) return "nan";
    if (std::isinf(x)) return x > 0 ? "inf" : "-inf";
    return x;
}

double real_from_json(const nlohmann::json& j)
{
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) {
        const auto s = j.get<std::string>();
        if (s == "inf")  return  std::numeric_limits<double>::infinity();
        if (s == "-inf") return -std::numeric_limits<double>::infinity();
        if (s == "nan")  return  std::numeric_limits<double>::quiet_NaN();
    }
    throw SerializationError("expected a real number, got " + j.dump());
}

} // namespace holofit
