#pragma once
/*
 * JSON model description files.
 *
 *  {
 *    "model":   "alpha" | "exact" | "perfect_lens",
 *    "theory":  "auto",
 *    "priors":  { "<id>": {"prior": "uniform", "lower": 0, "upper": 1}, ... },
 *    "scatterer": { "center": [ {"ref": "<id>"}, 5.0, {"prior": "gaussian", "mu": 10, "sd": 1} ],
 *                   "n": {"complex": [1.59, {"prior": "uniform", "lower": 0, "upper": 0.1}]},
 *                   "r": 0.5 },
 *    "optics":  { "medium_index": 1.33, "illum_wavelen": 0.66,
 *                 "illum_polarization": {"dims": "illumination", "coords": ["x","y"],
 *                                        "values": [1, 0]},
 *                 "noise_sd": null },
 *    "alpha": {"prior": "uniform", "lower": 0.1, "upper": 1.0},
 *    "lens_angle": 0.8,
 *    "ties":  [ {"parameters": ["a", "b"], "name": "ab"} ]
 *  }
 *
 * Every {"ref": id} resolves to the *same* prior object, so all of its
 * positions share one slot.  A shared prior without a "name" is named
 * after its id.
 */

#include "Model.hpp"
#include "Value.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace holofit {

struct TieRequest {
    std::vector<std::string>   parameters;
    std::optional<std::string> name;
};

struct ModelDescription {
    ModelKind               kind   = ModelKind::Alpha;
    std::string             theory = "auto";
    Value                   scatterer;
    OpticsSpec              optics;
    Dict                    extras;        // alpha, lens_angle
    std::vector<TieRequest> ties;
};

using PriorTable = std::map<std::string, PriorPtr>;

ModelDescription parse_model_description(const nlohmann::ordered_json& j);

/* load_ordered_json + expand_env + parse_model_description */
ModelDescription load_model_description(const std::string& path);

/* construct the model and apply the requested ties in order */
Model build_model(const ModelDescription& description, Model::Options options = {});

/* a model written by save_model (Model::to_json) */
Model load_model(const std::string& path, Model::Options options = {});
void save_model(const std::string& path, const Model& model);

/* single value; {"ref": id} is looked up in `shared` */
Value value_from_config(const nlohmann::ordered_json& j, const PriorTable& shared);
PriorPtr prior_from_config(const nlohmann::ordered_json& j,
                           std::optional<std::string> default_name = std::nullopt);

} // namespace holofit
