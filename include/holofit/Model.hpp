#pragma once
/*
 * A statistical model of holograms.  The model owns one parameter
 * registry and one map per group of its configuration
 *
 *      "scatterer"   scatterer parameters (always)
 *      "optics"      medium_index, illum_wavelen, illum_polarization, noise_sd
 *      "model"       {alpha}                  AlphaModel / PerfectLensModel
 *      "theory"      {lens_angle}             PerfectLensModel
 *
 * and exposes the free parameters as one flat vector.  Reads take a
 * shared lock, add_tie() takes the exclusive one so that the registry
 * merge and the rewrite of every map happen as one step.
 */

#include "Map.hpp"
#include "Observation.hpp"
#include "ParameterRegistry.hpp"
#include "ThreadPool.hpp"
#include "Types.hpp"
#include "Value.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace holofit {

enum class ModelKind { Alpha, Exact, PerfectLens };

std::string to_string(ModelKind kind);
ModelKind model_kind_from_string(const std::string& s);

/* optics entries of a model; null means "take it from the data" */
struct OpticsSpec {
    Value medium_index;
    Value illum_wavelen;
    Value illum_polarization;
    Value noise_sd;
};

/* everything a forward evaluator gets for one candidate */
struct ForwardInputs {
    Value       scatterer;   // reconstructed scatterer parameters
    Dict        optics;      // medium_index, illum_wavelen, illum_polarization
    Value       model;       // {alpha} or null
    Value       theory;      // {lens_angle} or null
    std::string theory_name;
};

/* computes the predicted data; may throw EvaluationFailure */
using ForwardModel = std::function<Vector(const ForwardInputs&, const Observation&)>;

/* vetoes a reconstructed scatterer (e.g. overlapping spheres) */
using Constraint = std::function<bool(const Value& scatterer)>;

/* decides noise_sd when neither the model nor the data provide one */
using NoisePolicy = std::function<Value(const std::vector<PriorPtr>& parameters)>;

/* 1.0 when every parameter is Uniform, MissingParameter otherwise */
Value uniform_noise_policy(const std::vector<PriorPtr>& parameters);

class Model {
public:
    struct Options {
        std::string             theory = "auto";
        ForwardModel            forward;
        std::vector<Constraint> constraints;
        NoisePolicy             noise_policy = uniform_noise_policy;
        bool                    verbose = false;
    };

    Model(ModelKind kind, const Value& scatterer, const OpticsSpec& optics,
          const Dict& extras = {}, Options options = {});

    Model(Model&& other);
    Model(const Model&)            = delete;
    Model& operator=(const Model&) = delete;
    Model& operator=(Model&&)      = delete;

    static Model alpha_model(const Value& scatterer, const OpticsSpec& optics,
                             const Value& alpha = 1.0, Options options = {});
    static Model exact_model(const Value& scatterer, const OpticsSpec& optics,
                             Options options = {});
    static Model perfect_lens_model(const Value& scatterer, const OpticsSpec& optics,
                                    const Value& alpha = 1.0, const Value& lens_angle = 1.0,
                                    Options options = {});

    ModelKind kind() const { return kind_; }
    const std::string& theory() const { return options_.theory; }

    /* -------- parameter table --------------------------------------- */
    std::size_t size() const;
    std::vector<std::string> parameter_names() const;
    std::vector<std::pair<std::string, PriorPtr>> parameters() const;
    PriorPtr parameter(const std::string& name) const;
    Vector initial_guess() const;

    /* -------- maps --------------------------------------------------- */
    bool has_map(const std::string& group) const;
    Map map(const std::string& group) const;
    std::vector<std::string> groups() const;

    /* -------- reconstruction ----------------------------------------- */
    Value read_group(const std::string& group, const Vector& values) const;
    Value scatterer_parameters(const Vector& values) const;
    Value scatterer() const;                    // priors in place
    Value alpha(const Vector& values) const;
    Value lens_angle(const Vector& values) const;

    Dict  find_optics(const Vector& values, const Dict& fallback = {}) const;
    Value find_noise(const Vector& values, const Dict& fallback = {}) const;

    /* -------- probabilities ------------------------------------------ */
    double lnprior(const Vector& values) const;
    double lnlike(const Vector& values, const Observation& data) const;
    /* `pixels`: evaluate the likelihood on that many randomly chosen pixels */
    double lnposterior(const Vector& values, const Observation& data,
                       std::optional<Eigen::Index> pixels = std::nullopt) const;

    /* one candidate per row */
    Vector lnprior_batch(const Matrix& candidates, ThreadPool& pool) const;
    Vector lnposterior_batch(const Matrix& candidates, const Observation& data,
                             ThreadPool& pool,
                             std::optional<Eigen::Index> pixels = std::nullopt) const;

    /* n starting points (rows) drawn around each parameter's guess */
    Matrix generate_guess(int n = 1, double scaling = 1.0,
                          std::optional<unsigned> seed = std::nullopt) const;

    /* -------- ties ----------------------------------------------------- */
    void add_tie(const std::vector<std::string>& names,
                 const std::optional<std::string>& new_name = std::nullopt);

    /* -------- serialization ------------------------------------------ */
    nlohmann::json to_json() const;
    static Model from_json(const nlohmann::json& j, Options options = {});

private:
    Model(ModelKind kind, ParameterRegistry registry,
          std::map<std::string, Map> maps, Options options);

    Value read_group_(const std::string& group, const Vector& values) const;
    Dict  find_optics_(const Vector& values, const Dict& fallback) const;
    Value find_noise_(const Vector& values, const Dict& fallback) const;
    double lnprior_(const Vector& values) const;
    double lnlike_(const Vector& values, const Observation& data) const;
    void   check_values_(const Vector& values) const;

    ModelKind                  kind_;
    Options                    options_;
    ParameterRegistry          registry_;
    std::map<std::string, Map> maps_;
    mutable std::shared_mutex  mtx_;
};

} // namespace holofit
