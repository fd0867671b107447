#include "holofit/ModelDescription.hpp"
#include "holofit/Errors.hpp"
#include "holofit/JsonUtils.hpp"
#include <limits>
#include <stdexcept>

namespace holofit {

namespace {

using ojson = nlohmann::ordered_json;

double real_field(const ojson& j, const char* key, double fallback)
{
    if (!j.contains(key) || j[key].is_null()) return fallback;
    const auto& v = j[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "inf")  return  std::numeric_limits<double>::infinity();
        if (s == "-inf") return -std::numeric_limits<double>::infinity();
    }
    throw ConfigError(std::string("\"") + key + "\" must be a number, got " + v.dump());
}

ComplexPart complex_part(const ojson& j, const PriorTable& shared)
{
    if (j.is_number()) return j.get<double>();
    Value v = value_from_config(j, shared);
    if (!v.is_parameter())
        throw ConfigError("complex parts must be numbers or priors, got " + j.dump());
    return v.as<PriorPtr>();
}

Value labelled_array(const ojson& j, const PriorTable& shared)
{
    LabelledArray a;
    a.dim = j["dims"].get<std::string>();
    for (const auto& c : j.at("coords")) {
        if (c.is_string()) a.coords.push_back(c.get<std::string>());
        else               a.coords.push_back(c.dump());
    }
    for (const auto& it : j.at("values")) a.items.push_back(value_from_config(it, shared));
    if (a.coords.size() != a.items.size())
        throw ConfigError("labelled array '" + a.dim + "' has " +
                          std::to_string(a.coords.size()) + " coordinates but " +
                          std::to_string(a.items.size()) + " values");
    return a;
}

} // namespace

PriorPtr prior_from_config(const ojson& j, std::optional<std::string> default_name)
{
    const auto kind = j.at("prior").get<std::string>();
    std::optional<std::string> name = std::move(default_name);
    if (j.contains("name") && !j["name"].is_null()) name = j["name"].get<std::string>();

    try {
        if (kind == "uniform") {
            std::optional<double> guess;
            if (j.contains("guess") && !j["guess"].is_null()) guess = j["guess"].get<double>();
            return std::make_shared<Uniform>(
                real_field(j, "lower", -std::numeric_limits<double>::infinity()),
                real_field(j, "upper",  std::numeric_limits<double>::infinity()),
                guess, name);
        }
        if (kind == "gaussian") {
            if (!j.contains("mu") || !j.contains("sd"))
                throw ConfigError("gaussian prior needs \"mu\" and \"sd\"");
            return std::make_shared<Gaussian>(real_field(j, "mu", 0.0),
                                              real_field(j, "sd", 1.0), name);
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    throw ConfigError("unknown prior kind '" + kind + "'");
}

Value value_from_config(const ojson& j, const PriorTable& shared)
{
    if (j.is_null())           return Value();
    if (j.is_boolean())        return j.get<bool>();
    if (j.is_number_integer()) return j.get<std::int64_t>();
    if (j.is_number_float())   return j.get<double>();
    if (j.is_string())         return j.get<std::string>();

    if (j.is_array()) {
        List items;
        for (const auto& it : j) items.push_back(value_from_config(it, shared));
        return items;
    }

    if (j.contains("prior")) return prior_from_config(j);

    if (j.contains("ref")) {
        const auto id = j["ref"].get<std::string>();
        auto it = shared.find(id);
        if (it == shared.end()) throw ConfigError("reference to undeclared prior '" + id + "'");
        return it->second;
    }

    if (j.contains("complex")) {
        const auto& c = j["complex"];
        if (!c.is_array() || c.size() != 2)
            throw ConfigError("\"complex\" needs [real, imag]");
        ComplexPair pair{complex_part(c[0], shared), complex_part(c[1], shared)};
        if (std::holds_alternative<double>(pair.real) && std::holds_alternative<double>(pair.imag))
            return std::complex<double>(std::get<double>(pair.real), std::get<double>(pair.imag));
        return pair;
    }

    if (j.contains("dims") && j.contains("coords") && j.contains("values"))
        return labelled_array(j, shared);

    Dict d;
    for (const auto& [key, val] : j.items()) d.push_back({key, value_from_config(val, shared)});
    return d;
}

ModelDescription parse_model_description(const ojson& j)
{
    if (!j.is_object()) throw ConfigError("model description must be a JSON object");

    ModelDescription d;
    try {
        if (j.contains("model"))  d.kind   = model_kind_from_string(j["model"].get<std::string>());
        if (j.contains("theory")) d.theory = j["theory"].get<std::string>();

        PriorTable shared;
        if (j.contains("priors"))
            for (const auto& [id, pj] : j["priors"].items())
                shared[id] = prior_from_config(pj, id);

        if (!j.contains("scatterer")) throw ConfigError("missing \"scatterer\"");
        d.scatterer = value_from_config(j["scatterer"], shared);
        if (!d.scatterer.get_if<Dict>())
            throw ConfigError("\"scatterer\" must be an object of parameters");

        if (j.contains("optics")) {
            const auto& o = j["optics"];
            for (const auto& [key, val] : o.items()) {
                Value v = value_from_config(val, shared);
                if      (key == "medium_index")       d.optics.medium_index       = std::move(v);
                else if (key == "illum_wavelen")      d.optics.illum_wavelen      = std::move(v);
                else if (key == "illum_polarization") d.optics.illum_polarization = std::move(v);
                else if (key == "noise_sd")           d.optics.noise_sd           = std::move(v);
                else throw ConfigError("unknown optics entry \"" + key + "\"");
            }
        }

        for (const char* key : {"alpha", "lens_angle"})
            if (j.contains(key)) d.extras.push_back({key, value_from_config(j[key], shared)});

        if (j.contains("ties")) {
            for (const auto& t : j["ties"]) {
                TieRequest req;
                req.parameters = t.at("parameters").get<std::vector<std::string>>();
                if (t.contains("name") && !t["name"].is_null())
                    req.name = t["name"].get<std::string>();
                d.ties.push_back(std::move(req));
            }
        }
    } catch (const ojson::exception& e) {
        throw ConfigError(e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return d;
}

ModelDescription load_model_description(const std::string& path)
{
    auto j = load_ordered_json(path);
    expand_env(j);
    return parse_model_description(j);
}

Model load_model(const std::string& path, Model::Options options)
{
    try {
        return Model::from_json(load_json(path), std::move(options));
    } catch (const SerializationError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void save_model(const std::string& path, const Model& model)
{
    save_json(path, model.to_json());
}

Model build_model(const ModelDescription& description, Model::Options options)
{
    options.theory = description.theory;
    Model model(description.kind, description.scatterer, description.optics,
                description.extras, std::move(options));
    for (const auto& t : description.ties)
        model.add_tie(t.parameters, t.name);
    return model;
}

} // namespace holofit
