#include "holofit/Model.hpp"
#include "holofit/Errors.hpp"
#include "holofit/MapBuilder.hpp"
#include "holofit/MapReader.hpp"
#include "holofit/TieEditor.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <random>
#include <stdexcept>

namespace holofit {

namespace {

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

/* fixed, so that every candidate is compared on the same pixels */
constexpr unsigned kSubsetSeed = 0;

const char* const kOpticsKeys[] = {"medium_index", "illum_wavelen", "illum_polarization"};

Value value_or(const Dict& extras, const std::string& key, const Value& fallback)
{
    const Value* v = find(extras, key);
    return v ? *v : fallback;
}

const Value* non_null(const Value* v)
{
    return (v && !v->is_null()) ? v : nullptr;
}

/* scalar noise, or one entry per pixel of the data or of the full data */
Vector noise_vector(const Value& noise, const Observation& data)
{
    const Eigen::Index n = data.size();
    if (noise.is_number()) return Vector::Constant(n, noise.to_double());

    const List* items = noise.get_if<List>();
    if (const auto* a = noise.get_if<LabelledArray>()) items = &a->items;
    if (!items)
        throw std::invalid_argument("noise_sd must be a number or a list of numbers, got " +
                                    to_string(noise));

    const auto count = static_cast<Eigen::Index>(items->size());
    Vector out(n);
    if (count == n) {
        for (Eigen::Index i = 0; i < n; ++i)
            out[i] = (*items)[static_cast<std::size_t>(i)].to_double();
    } else if (data.is_subset() && count == data.full_size()) {
        for (Eigen::Index i = 0; i < n; ++i)
            out[i] = (*items)[static_cast<std::size_t>(data.pixels()[static_cast<std::size_t>(i)])].to_double();
    } else {
        throw std::invalid_argument("noise_sd has " + std::to_string(items->size()) +
                                    " entries for " + std::to_string(n) + " data points");
    }
    return out;
}

std::string join(const std::vector<std::string>& names)
{
    std::string s;
    for (const auto& n : names) s += (s.empty() ? "" : ", ") + n;
    return s;
}

} // namespace

std::string to_string(ModelKind kind)
{
    switch (kind) {
    case ModelKind::Alpha:       return "alpha";
    case ModelKind::Exact:       return "exact";
    case ModelKind::PerfectLens: return "perfect_lens";
    }
    throw std::invalid_argument("invalid model kind");
}

ModelKind model_kind_from_string(const std::string& s)
{
    if (s == "alpha")        return ModelKind::Alpha;
    if (s == "exact")        return ModelKind::Exact;
    if (s == "perfect_lens") return ModelKind::PerfectLens;
    throw std::invalid_argument("unknown model kind '" + s + "'");
}

Value uniform_noise_policy(const std::vector<PriorPtr>& parameters)
{
    for (const auto& p : parameters)
        if (!dynamic_cast<const Uniform*>(p.get()))
            throw MissingParameter("noise_sd for non-uniform priors");
    return 1.0;
}

/* ------------------------------------------------------------------------- */
/*  construction                                                             */
/* ------------------------------------------------------------------------- */
Model::Model(ModelKind kind, const Value& scatterer, const OpticsSpec& optics,
             const Dict& extras, Options options)
    : kind_(kind), options_(std::move(options))
{
    if (!scatterer.get_if<Dict>())
        throw std::invalid_argument("scatterer parameters must be a dictionary");

    for (const auto& e : extras)
        if (!((e.key == "alpha" && kind_ != ModelKind::Exact) ||
              (e.key == "lens_angle" && kind_ == ModelKind::PerfectLens)))
            throw std::invalid_argument(e.key + " is not a parameter of a " +
                                        to_string(kind_) + " model");

    MapBuilder builder(registry_);
    maps_["scatterer"] = builder.build(scatterer);
    maps_["optics"]    = builder.build(Dict{{"medium_index",       optics.medium_index},
                                            {"illum_wavelen",      optics.illum_wavelen},
                                            {"illum_polarization", optics.illum_polarization},
                                            {"noise_sd",           optics.noise_sd}});
    if (kind_ != ModelKind::Exact)
        maps_["model"] = builder.build(Dict{{"alpha", value_or(extras, "alpha", 1.0)}});
    if (kind_ == ModelKind::PerfectLens)
        maps_["theory"] = builder.build(Dict{{"lens_angle", value_or(extras, "lens_angle", 1.0)}});

    if (options_.verbose)
        std::cout << "[Model] " << to_string(kind_) << " model with "
                  << registry_.size() << " free parameters: "
                  << join(registry_.names()) << '\n';
}

Model::Model(ModelKind kind, ParameterRegistry registry,
             std::map<std::string, Map> maps, Options options)
    : kind_(kind)
    , options_(std::move(options))
    , registry_(std::move(registry))
    , maps_(std::move(maps))
{}

Model::Model(Model&& other)
    : kind_(other.kind_)
{
    std::unique_lock lk(other.mtx_);
    options_  = std::move(other.options_);
    registry_ = std::move(other.registry_);
    maps_     = std::move(other.maps_);
}

Model Model::alpha_model(const Value& scatterer, const OpticsSpec& optics,
                         const Value& alpha, Options options)
{
    return Model(ModelKind::Alpha, scatterer, optics, Dict{{"alpha", alpha}}, std::move(options));
}

Model Model::exact_model(const Value& scatterer, const OpticsSpec& optics, Options options)
{
    return Model(ModelKind::Exact, scatterer, optics, Dict{}, std::move(options));
}

Model Model::perfect_lens_model(const Value& scatterer, const OpticsSpec& optics,
                                const Value& alpha, const Value& lens_angle,
                                Options options)
{
    return Model(ModelKind::PerfectLens, scatterer, optics,
                 Dict{{"alpha", alpha}, {"lens_angle", lens_angle}}, std::move(options));
}

/* ------------------------------------------------------------------------- */
/*  parameter table                                                          */
/* ------------------------------------------------------------------------- */
std::size_t Model::size() const
{
    std::shared_lock lk(mtx_);
    return registry_.size();
}

std::vector<std::string> Model::parameter_names() const
{
    std::shared_lock lk(mtx_);
    return registry_.names();
}

std::vector<std::pair<std::string, PriorPtr>> Model::parameters() const
{
    std::shared_lock lk(mtx_);
    std::vector<std::pair<std::string, PriorPtr>> out;
    out.reserve(registry_.size());
    for (std::size_t i = 0; i < registry_.size(); ++i)
        out.emplace_back(registry_.names()[i], registry_.parameters()[i]);
    return out;
}

PriorPtr Model::parameter(const std::string& name) const
{
    std::shared_lock lk(mtx_);
    auto idx = registry_.find(name);
    if (!idx) throw UnknownParameter(name);
    return registry_.parameters()[*idx];
}

Vector Model::initial_guess() const
{
    std::shared_lock lk(mtx_);
    return registry_.guess();
}

bool Model::has_map(const std::string& group) const
{
    std::shared_lock lk(mtx_);
    return maps_.count(group) > 0;
}

Map Model::map(const std::string& group) const
{
    std::shared_lock lk(mtx_);
    auto it = maps_.find(group);
    if (it == maps_.end()) throw std::out_of_range("model has no '" + group + "' map");
    return it->second;
}

std::vector<std::string> Model::groups() const
{
    std::shared_lock lk(mtx_);
    std::vector<std::string> out;
    for (const auto& [name, m] : maps_) out.push_back(name);
    return out;
}

/* ------------------------------------------------------------------------- */
/*  reconstruction                                                           */
/* ------------------------------------------------------------------------- */
Value Model::read_group(const std::string& group, const Vector& values) const
{
    std::shared_lock lk(mtx_);
    return read_group_(group, values);
}

Value Model::scatterer_parameters(const Vector& values) const
{
    return read_group("scatterer", values);
}

Value Model::scatterer() const
{
    std::shared_lock lk(mtx_);
    return read_map(maps_.at("scatterer"), registry_.parameters());
}

Value Model::alpha(const Vector& values) const
{
    const Value v = read_group("model", values);
    const Value* a = v.find("alpha");
    if (!a) throw MissingParameter("alpha");
    return *a;
}

Value Model::lens_angle(const Vector& values) const
{
    const Value v = read_group("theory", values);
    const Value* a = v.find("lens_angle");
    if (!a) throw MissingParameter("lens_angle");
    return *a;
}

Dict Model::find_optics(const Vector& values, const Dict& fallback) const
{
    std::shared_lock lk(mtx_);
    return find_optics_(values, fallback);
}

Value Model::find_noise(const Vector& values, const Dict& fallback) const
{
    std::shared_lock lk(mtx_);
    return find_noise_(values, fallback);
}

Value Model::read_group_(const std::string& group, const Vector& values) const
{
    auto it = maps_.find(group);
    if (it == maps_.end()) throw std::out_of_range("model has no '" + group + "' map");
    return read_map(it->second, values);
}

Dict Model::find_optics_(const Vector& values, const Dict& fallback) const
{
    const Value mapped = read_group_("optics", values);

    Dict out;
    for (const char* key : kOpticsKeys) {
        const Value* v = non_null(mapped.find(key));
        if (!v) v = non_null(find(fallback, key));
        if (!v) throw MissingParameter(key);
        out.push_back({key, *v});
    }
    return out;
}

Value Model::find_noise_(const Vector& values, const Dict& fallback) const
{
    const Value mapped = read_group_("optics", values);
    if (const Value* v = non_null(mapped.find("noise_sd"))) return *v;
    if (const Value* v = non_null(find(fallback, "noise_sd"))) return *v;
    if (!options_.noise_policy) throw MissingParameter("noise_sd");
    return options_.noise_policy(registry_.parameters());
}

/* ------------------------------------------------------------------------- */
/*  probabilities                                                            */
/* ------------------------------------------------------------------------- */
void Model::check_values_(const Vector& values) const
{
    if (static_cast<std::size_t>(values.size()) != registry_.size())
        throw std::out_of_range("expected " + std::to_string(registry_.size()) +
                                " parameter values, got " + std::to_string(values.size()));
}

double Model::lnprior(const Vector& values) const
{
    std::shared_lock lk(mtx_);
    return lnprior_(values);
}

double Model::lnlike(const Vector& values, const Observation& data) const
{
    std::shared_lock lk(mtx_);
    return lnlike_(values, data);
}

double Model::lnposterior(const Vector& values, const Observation& data,
                          std::optional<Eigen::Index> pixels) const
{
    std::shared_lock lk(mtx_);
    const double lp = lnprior_(values);
    /* the prior forbids e.g. negative radii; no hologram exists there */
    if (lp == kNegInf) return lp;
    if (pixels) return lp + lnlike_(values, data.random_subset(*pixels, kSubsetSeed));
    return lp + lnlike_(values, data);
}

double Model::lnprior_(const Vector& values) const
{
    check_values_(values);

    if (!options_.constraints.empty()) {
        const Value scat = read_group_("scatterer", values);
        try {
            for (const auto& ok : options_.constraints)
                if (!ok(scat)) return kNegInf;
        } catch (const EvaluationFailure&) {
            return kNegInf;
        }
    }

    const auto& priors = registry_.parameters();
    double lp = 0.0;
    for (std::size_t i = 0; i < priors.size(); ++i) {
        if (!priors[i]) throw MissingParameter(registry_.names()[i] + " has no prior");
        lp += priors[i]->lnprob(values[static_cast<Eigen::Index>(i)]);
    }
    return lp;
}

double Model::lnlike_(const Vector& values, const Observation& data) const
{
    check_values_(values);
    if (!options_.forward)
        throw std::logic_error(to_string(kind_) + " model has no forward evaluator");

    ForwardInputs in;
    in.scatterer   = read_group_("scatterer", values);
    in.optics      = find_optics_(values, data.metadata());
    in.model       = maps_.count("model")  ? read_group_("model", values)  : Value();
    in.theory      = maps_.count("theory") ? read_group_("theory", values) : Value();
    in.theory_name = options_.theory;

    const Eigen::Index n = data.size();
    const Vector sigma = noise_vector(find_noise_(values, data.metadata()), data);

    Vector predicted;
    try {
        predicted = options_.forward(in, data);
    } catch (const EvaluationFailure& e) {
        if (options_.verbose) std::cerr << "[Model] " << e.what() << '\n';
        return kNegInf;
    }
    if (predicted.size() != n)
        throw std::invalid_argument("forward model returned " + std::to_string(predicted.size()) +
                                    " points for " + std::to_string(n) + " data points");

    const Vector resid = ((predicted - data.values()).array() / sigma.array()).matrix();
    return -0.5 * static_cast<double>(n) * std::log(2.0 * M_PI)
           - static_cast<double>(n) * sigma.array().log().mean()
           - 0.5 * resid.squaredNorm();
}

Vector Model::lnprior_batch(const Matrix& candidates, ThreadPool& pool) const
{
    auto out = pool.parallel_map(static_cast<std::size_t>(candidates.rows()),
        [this, &candidates](std::size_t i) {
            const Vector v = candidates.row(static_cast<Eigen::Index>(i)).transpose();
            return lnprior(v);
        });
    return Eigen::Map<Vector>(out.data(), static_cast<Eigen::Index>(out.size()));
}

Vector Model::lnposterior_batch(const Matrix& candidates, const Observation& data,
                                ThreadPool& pool, std::optional<Eigen::Index> pixels) const
{
    const Observation used = pixels ? data.random_subset(*pixels, kSubsetSeed) : data;
    auto out = pool.parallel_map(static_cast<std::size_t>(candidates.rows()),
        [this, &candidates, &used](std::size_t i) {
            const Vector v = candidates.row(static_cast<Eigen::Index>(i)).transpose();
            return lnposterior(v, used);
        });
    return Eigen::Map<Vector>(out.data(), static_cast<Eigen::Index>(out.size()));
}

Matrix Model::generate_guess(int n, double scaling, std::optional<unsigned> seed) const
{
    if (n < 1) throw std::invalid_argument("generate_guess: n must be positive");

    std::shared_lock lk(mtx_);
    std::mt19937_64 rng(seed ? *seed : std::random_device{}());

    const auto& priors = registry_.parameters();
    Matrix out(n, static_cast<Eigen::Index>(priors.size()));
    for (Eigen::Index c = 0; c < out.cols(); ++c) {
        const auto& p = priors[static_cast<std::size_t>(c)];
        if (!p) throw MissingParameter(registry_.names()[static_cast<std::size_t>(c)] + " has no prior");
        for (Eigen::Index r = 0; r < n; ++r)
            out(r, c) = p->guess() + scaling * (p->sample(rng) - p->guess());
    }
    return out;
}

/* ------------------------------------------------------------------------- */
/*  ties                                                                     */
/* ------------------------------------------------------------------------- */
void Model::add_tie(const std::vector<std::string>& names,
                    const std::optional<std::string>& new_name)
{
    std::unique_lock lk(mtx_);

    if (names.empty()) throw UnknownParameter("no parameters given to tie");

    std::vector<std::size_t> indices;
    indices.reserve(names.size());
    for (const auto& n : names) {
        auto idx = registry_.find(n);
        if (!idx)
            throw UnknownParameter("cannot tie " + n + ", it is not one of " +
                                   join(registry_.names()));
        indices.push_back(*idx);
    }

    /* work on copies and commit once everything succeeded */
    ParameterRegistry registry = registry_;
    const Renumbering renumber = registry.merge(indices, new_name);

    std::map<std::string, Map> maps;
    for (const auto& [group, m] : maps_) maps.emplace(group, retarget_map(m, renumber));

    registry_ = std::move(registry);
    maps_     = std::move(maps);

    if (options_.verbose)
        std::cout << "[Tie] " << join(names) << " -> "
                  << registry_.names()[renumber[indices.front()]]
                  << " (" << registry_.size() << " free parameters)\n";
}

/* ------------------------------------------------------------------------- */
/*  serialization                                                            */
/* ------------------------------------------------------------------------- */
nlohmann::json Model::to_json() const
{
    std::shared_lock lk(mtx_);

    nlohmann::json j;
    j["kind"]            = to_string(kind_);
    j["theory"]          = options_.theory;
    j["parameter_names"] = registry_.names();

    nlohmann::json pars = nlohmann::json::array();
    for (const auto& p : registry_.parameters())
        pars.push_back(p ? p->to_json() : nlohmann::json(nullptr));
    j["parameters"] = pars;

    nlohmann::json maps = nlohmann::json::object();
    for (const auto& [group, m] : maps_) maps[group] = m;
    j["maps"] = maps;
    return j;
}

Model Model::from_json(const nlohmann::json& j, Options options)
{
    if (!j.is_object()) throw SerializationError("model must be a JSON object");

    ModelKind kind;
    std::vector<std::string> names;
    try {
        kind  = model_kind_from_string(j.at("kind").get<std::string>());
        names = j.at("parameter_names").get<std::vector<std::string>>();
        if (j.contains("theory")) options.theory = j["theory"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(e.what());
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }

    /* a recipe stored without its parameters still loads; its slots
       stay unresolved until values are supplied */
    std::vector<PriorPtr> slots(names.size());
    if (j.contains("parameters") && !j["parameters"].is_null()) {
        const auto& pars = j["parameters"];
        if (!pars.is_array() || pars.size() != names.size())
            throw SerializationError("parameters and parameter_names differ in length");
        for (std::size_t i = 0; i < names.size(); ++i)
            if (!pars[i].is_null()) slots[i] = Prior::from_json(pars[i]);
    }

    std::map<std::string, Map> maps;
    if (!j.contains("maps") || !j["maps"].is_object())
        throw SerializationError("model without maps");
    for (const auto& [group, mj] : j["maps"].items()) {
        Map m = mj.get<Map>();
        for (auto s : slot_references(m))
            if (s >= names.size())
                throw SerializationError("map '" + group + "' references slot " +
                                         std::to_string(s) + " of " +
                                         std::to_string(names.size()));
        maps.emplace(group, std::move(m));
    }
    for (const char* required : {"scatterer", "optics"})
        if (!maps.count(required))
            throw SerializationError(std::string("model without '") + required + "' map");

    ParameterRegistry registry;
    try {
        registry = ParameterRegistry(std::move(slots), std::move(names));
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }
    return Model(kind, std::move(registry), std::move(maps), std::move(options));
}

} // namespace holofit
