#include "holofit/Errors.hpp"
#include "holofit/ModelDescription.hpp"

#include <catch2/catch.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace holofit;
using nlohmann::ordered_json;

namespace {

const char* const kDimer = R"({
    "model": "alpha",
    "theory": "mie",
    "priors": {
        "z": {"prior": "uniform", "lower": 5, "upper": 15}
    },
    "scatterer": {
        "s0": {"center": [1.0, 2.0, {"ref": "z"}], "r": {"prior": "uniform", "lower": 0, "upper": 1}},
        "s1": {"center": [3.0, 4.0, {"ref": "z"}], "r": {"prior": "uniform", "lower": 0, "upper": 1}},
        "n": {"complex": [1.59, {"prior": "uniform", "lower": 0, "upper": 0.1, "name": "kappa"}]}
    },
    "optics": {
        "medium_index": 1.33,
        "illum_wavelen": 0.66,
        "illum_polarization": {"dims": "illumination", "coords": ["x", "y"], "values": [1, 0]},
        "noise_sd": 0.05
    },
    "alpha": {"prior": "uniform", "lower": 0.1, "upper": 1.0, "guess": 0.7},
    "ties": [{"parameters": ["s0.r", "s1.r"], "name": "r"}]
})";

} // namespace

TEST_CASE("description_parses_every_section") {
    const ModelDescription d = parse_model_description(ordered_json::parse(kDimer));

    REQUIRE(d.kind == ModelKind::Alpha);
    REQUIRE(d.theory == "mie");
    REQUIRE(d.ties.size() == 1);
    REQUIRE(d.ties[0].name == std::optional<std::string>("r"));
    REQUIRE(d.optics.noise_sd == Value(0.05));

    const auto& pol = d.optics.illum_polarization.as<LabelledArray>();
    REQUIRE(pol.dim == "illumination");
    REQUIRE(pol.coords == std::vector<std::string>{"x", "y"});
    REQUIRE(pol.items == List{1, 0});

    REQUIRE(d.scatterer.as<Dict>()[0].key == "s0");
    REQUIRE(d.scatterer.find("n")->kind() == Value::Kind::ComplexPair);
}

TEST_CASE("shared_reference_becomes_one_slot") {
    Model model = build_model(parse_model_description(ordered_json::parse(kDimer)));

    REQUIRE(model.parameter_names() ==
            std::vector<std::string>{"z", "r", "kappa", "alpha"});
    REQUIRE(model.theory() == "mie");

    Vector v(4);
    v << 9.0, 0.4, 0.02, 0.7;
    const Value s = model.scatterer_parameters(v);
    REQUIRE(s.find("s0")->find("center")->as<List>()[2] == Value(9.0));
    REQUIRE(s.find("s1")->find("center")->as<List>()[2] == Value(9.0));
    REQUIRE(*s.find("s1")->find("r") == Value(0.4));
    REQUIRE(*s.find("n") == Value(std::complex<double>(1.59, 0.02)));
    REQUIRE(model.alpha(v) == Value(0.7));
}

TEST_CASE("constant_complex_and_scalars_stay_constant") {
    const auto j = ordered_json::parse(R"({
        "model": "exact",
        "scatterer": {"n": {"complex": [1.59, 0.001]}, "label": "bead", "solid": true},
        "optics": {"medium_index": 1.33}
    })");
    const ModelDescription d = parse_model_description(j);
    REQUIRE(*d.scatterer.find("n") == Value(std::complex<double>(1.59, 0.001)));
    REQUIRE(*d.scatterer.find("label") == Value("bead"));
    REQUIRE(*d.scatterer.find("solid") == Value(true));
    REQUIRE(d.optics.illum_wavelen.is_null());

    Model model = build_model(d);
    REQUIRE(model.size() == 0);
}

TEST_CASE("gaussian_and_improper_priors") {
    const auto j = ordered_json::parse(R"({
        "scatterer": {"r": {"prior": "gaussian", "mu": 0.5, "sd": 0.05},
                      "z": {"prior": "uniform", "lower": 0, "upper": "inf", "guess": 10}}
    })");
    const ModelDescription d = parse_model_description(j);
    const auto& r = d.scatterer.find("r")->as<PriorPtr>();
    const auto& z = d.scatterer.find("z")->as<PriorPtr>();
    REQUIRE(r->kind() == "gaussian");
    REQUIRE(r->guess() == Approx(0.5));
    REQUIRE(z->guess() == Approx(10.0));
    REQUIRE(z->lnprob(1e6) == 0.0);
}

TEST_CASE("bad_descriptions_raise_config_errors") {
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::array()), ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(R"({"optics": {}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(
                          R"({"scatterer": {"z": {"ref": "missing"}}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(
                          R"({"scatterer": {}, "optics": {"wavelength": 0.66}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(
                          R"({"scatterer": {"r": {"prior": "cauchy"}}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(
                          R"({"scatterer": {"r": {"prior": "uniform", "lower": 2, "upper": 1}}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(parse_model_description(ordered_json::parse(
                          R"({"model": "lorenz", "scatterer": {}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(load_model_description("/nonexistent/holofit/model.json"), ConfigError);
}

TEST_CASE("ties_in_a_description_must_be_valid") {
    const auto j = ordered_json::parse(R"({
        "model": "exact",
        "scatterer": {"a": {"prior": "uniform", "lower": 0, "upper": 1},
                      "b": {"prior": "uniform", "lower": 0, "upper": 2}},
        "ties": [{"parameters": ["a", "b"]}]
    })");
    REQUIRE_THROWS_AS(build_model(parse_model_description(j)), TieError);
}

namespace {

std::string temp_file(const std::string& name, const std::string& contents)
{
    const auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream(path) << contents;
    return path;
}

} // namespace

TEST_CASE("description_file_expands_environment_and_applies_ties") {
    setenv("HOLOFIT_TEST_THEORY", "mie", 1);
    const auto path = temp_file("holofit_test_description.json", R"({
        "model": "exact",
        "theory": "${HOLOFIT_TEST_THEORY}",
        "scatterer": {"a": {"prior": "uniform", "lower": 0, "upper": 1},
                      "b": {"prior": "uniform", "lower": 0, "upper": 1},
                      "c": 0.5},
        "optics": {"medium_index": 1.33},
        "ties": [{"parameters": ["a", "b"], "name": "ab"}]
    })");

    const ModelDescription d = load_model_description(path);
    REQUIRE(d.theory == "mie");
    REQUIRE(d.ties.size() == 1);

    Model model = build_model(d);
    REQUIRE(model.theory() == "mie");
    REQUIRE(model.parameter_names() == std::vector<std::string>{"ab"});
    REQUIRE(slot_references(model.map("scatterer")) == std::vector<std::size_t>{0, 0});
    std::filesystem::remove(path);
}

TEST_CASE("saved_model_loads_back") {
    Model model = build_model(parse_model_description(ordered_json::parse(kDimer)));
    const auto path = (std::filesystem::temp_directory_path() / "holofit_test_model.json").string();
    save_model(path, model);

    Model back = load_model(path);
    REQUIRE(back.parameter_names() == model.parameter_names());
    REQUIRE(back.theory() == "mie");
    const Vector g = model.initial_guess();
    REQUIRE(back.scatterer_parameters(g) == model.scatterer_parameters(g));
    std::filesystem::remove(path);

    const auto bad = temp_file("holofit_test_bad_model.json", R"({"kind": "exact"})");
    REQUIRE_THROWS_AS(load_model(bad), ConfigError);
    std::filesystem::remove(bad);
}
