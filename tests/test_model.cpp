#include "holofit/Errors.hpp"
#include "holofit/Model.hpp"
#include "holofit/ThreadPool.hpp"

#include <catch2/catch.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>

using namespace holofit;

namespace {

constexpr double kNegInf = -std::numeric_limits<double>::infinity();

Value sphere()
{
    return Dict{{"r",      std::make_shared<Uniform>(0.0, 1.0, 0.5)},
                {"center", List{std::make_shared<Uniform>(0.0, 10.0), 5.0, 10.0}},
                {"n",      1.59}};
}

/* predicted hologram: r at every pixel */
Vector flat_hologram(const ForwardInputs& in, const Observation& data)
{
    return Vector::Constant(data.size(), in.scatterer.find("r")->to_double());
}

Model::Options with_forward()
{
    Model::Options o;
    o.forward = flat_hologram;
    return o;
}

} // namespace

TEST_CASE("alpha_model_has_all_groups") {
    Model model = Model::alpha_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1},
                                     std::make_shared<Uniform>(0.1, 1.0, 0.8));

    REQUIRE(model.kind() == ModelKind::Alpha);
    REQUIRE(model.groups() == std::vector<std::string>{"model", "optics", "scatterer"});
    REQUIRE(model.parameter_names() == std::vector<std::string>{"r", "center.0", "alpha"});
    REQUIRE(model.alpha(model.initial_guess()) == Value(0.8));
    REQUIRE_THROWS_AS(model.parameter("radius"), UnknownParameter);
    REQUIRE(model.parameter("alpha")->guess() == Approx(0.8));
}

TEST_CASE("exact_model_has_no_model_group") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1});
    REQUIRE_FALSE(model.has_map("model"));
    REQUIRE_THROWS_AS(model.map("model"), std::out_of_range);
    REQUIRE_THROWS_AS(model.alpha(model.initial_guess()), std::out_of_range);
    REQUIRE_THROWS_AS((Model(ModelKind::Exact, sphere(), OpticsSpec{}, Dict{{"alpha", 1.0}})),
                      std::invalid_argument);
}

TEST_CASE("perfect_lens_model_maps_lens_angle") {
    Model model = Model::perfect_lens_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, 1.0,
                                            std::make_shared<Uniform>(0.1, 1.2, 0.6));
    REQUIRE(model.has_map("theory"));
    REQUIRE(model.parameter_names().back() == "lens_angle");
    REQUIRE(model.lens_angle(model.initial_guess()) == Value(0.6));
    REQUIRE(model.alpha(model.initial_guess()) == Value(1.0));
}

TEST_CASE("scatterer_must_be_a_dictionary") {
    REQUIRE_THROWS_AS(Model::exact_model(List{1.0}, OpticsSpec{}), std::invalid_argument);
}

TEST_CASE("find_optics_prefers_model_then_data") {
    OpticsSpec optics;
    optics.medium_index = std::make_shared<Uniform>(1.3, 1.4, 1.33);
    Model model = Model::exact_model(sphere(), optics);

    const Vector g = model.initial_guess();
    REQUIRE_THROWS_AS(model.find_optics(g), MissingParameter);

    const Dict metadata{{"medium_index", 1.0}, {"illum_wavelen", 0.66},
                        {"illum_polarization", List{1.0, 0.0}}};
    const Dict found = model.find_optics(g, metadata);
    REQUIRE(found.size() == 3);
    REQUIRE(*find(found, "medium_index") == Value(1.33));
    REQUIRE(*find(found, "illum_wavelen") == Value(0.66));
    REQUIRE(*find(found, "illum_polarization") == Value(List{1.0, 0.0}));
}

TEST_CASE("find_noise_sources") {
    const Vector unused;

    SECTION("mapped value") {
        Model model = Model::exact_model(Dict{{"r", 0.5}}, OpticsSpec{1.33, 0.66, 1.0, 0.2});
        REQUIRE(model.find_noise(unused, Dict{{"noise_sd", 0.5}}) == Value(0.2));
    }
    SECTION("data metadata") {
        Model model = Model::exact_model(Dict{{"r", 0.5}}, OpticsSpec{1.33, 0.66, 1.0, {}});
        REQUIRE(model.find_noise(unused, Dict{{"noise_sd", 0.5}}) == Value(0.5));
    }
    SECTION("uniform priors default to one") {
        Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, {}});
        REQUIRE(model.find_noise(model.initial_guess()) == Value(1.0));
    }
    SECTION("other priors need an explicit noise") {
        Model model = Model::exact_model(Dict{{"r", std::make_shared<Gaussian>(0.5, 0.1)}},
                                         OpticsSpec{1.33, 0.66, 1.0, {}});
        REQUIRE_THROWS_AS(model.find_noise(model.initial_guess()), MissingParameter);
    }
    SECTION("injected policy") {
        Model::Options o;
        o.noise_policy = [](const std::vector<PriorPtr>& ps) {
            return Value(0.01 * static_cast<double>(ps.size()));
        };
        Model model = Model::exact_model(Dict{{"r", std::make_shared<Gaussian>(0.5, 0.1)}},
                                         OpticsSpec{1.33, 0.66, 1.0, {}}, o);
        REQUIRE(model.find_noise(model.initial_guess()).to_double() == Approx(0.01));
    }
}

TEST_CASE("lnprior_sums_parameter_log_probabilities") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1});

    Vector v(2);
    v << 0.3, 4.0;
    REQUIRE(model.lnprior(v) == Approx(-std::log(1.0) - std::log(10.0)));

    v << 1.5, 4.0;
    REQUIRE(model.lnprior(v) == kNegInf);

    REQUIRE_THROWS_AS(model.lnprior(Vector::Zero(3)), std::out_of_range);
}

TEST_CASE("constraints_veto_candidates") {
    Model::Options o;
    o.constraints.push_back([](const Value& s) { return s.find("r")->to_double() < 0.5; });
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, o);

    Vector v(2);
    v << 0.4, 4.0;
    REQUIRE(std::isfinite(model.lnprior(v)));
    v << 0.6, 4.0;
    REQUIRE(model.lnprior(v) == kNegInf);
}

TEST_CASE("lnlike_is_gaussian_in_the_residual") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, with_forward());
    const Observation data(Vector::Constant(3, 0.5));

    Vector v(2);
    v << 0.5, 4.0;
    const double at_truth = -1.5 * std::log(2.0 * M_PI) - 3.0 * std::log(0.1);
    REQUIRE(model.lnlike(v, data) == Approx(at_truth));

    v << 0.6, 4.0;
    REQUIRE(model.lnlike(v, data) == Approx(at_truth - 0.5 * 3.0 * 1.0));
    REQUIRE(model.lnposterior(v, data) == Approx(model.lnprior(v) + model.lnlike(v, data)));

    v << 1.5, 4.0;
    REQUIRE(model.lnposterior(v, data) == kNegInf);
}

TEST_CASE("lnlike_accepts_per_point_noise") {
    OpticsSpec optics{1.33, 0.66, 1.0, List{0.1, 0.2}};
    Model model = Model::exact_model(sphere(), optics, with_forward());
    const Observation data(Vector::Constant(2, 0.5));

    Vector v(2);
    v << 0.5, 4.0;
    REQUIRE(model.lnlike(v, data) ==
            Approx(-std::log(2.0 * M_PI) - std::log(0.1) - std::log(0.2)));

    REQUIRE_THROWS_AS(model.lnlike(v, Observation(Vector::Constant(3, 0.5))),
                      std::invalid_argument);
}

TEST_CASE("failed_evaluation_is_impossible_not_fatal") {
    Model::Options o;
    o.forward = [](const ForwardInputs&, const Observation&) -> Vector {
        throw EvaluationFailure("multisphere did not converge");
    };
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, o);

    REQUIRE(model.lnlike(model.initial_guess(), Observation(Vector::Zero(2))) == kNegInf);
}

TEST_CASE("lnlike_without_forward_model_throws") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1});
    REQUIRE_THROWS_AS(model.lnlike(model.initial_guess(), Observation(Vector::Zero(2))),
                      std::logic_error);
}

TEST_CASE("forward_model_sees_optics_and_theory") {
    Model::Options o;
    o.theory = "mie";
    o.forward = [](const ForwardInputs& in, const Observation& data) -> Vector {
        REQUIRE(in.theory_name == "mie");
        REQUIRE(*find(in.optics, "medium_index") == Value(1.33));
        REQUIRE(*in.model.find("alpha") == Value(1.0));
        REQUIRE(in.theory.is_null());
        return Vector::Zero(data.size());
    };
    Model model = Model::alpha_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, 1.0, o);
    REQUIRE(std::isfinite(model.lnlike(model.initial_guess(), Observation(Vector::Zero(2)))));
}

TEST_CASE("batch_evaluation_matches_sequential") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, with_forward());
    const Observation data(Vector::Constant(4, 0.5));
    const Matrix candidates = model.generate_guess(16, 1.0, 7u);

    ThreadPool pool(4);
    const Vector priors = model.lnprior_batch(candidates, pool);
    const Vector posts  = model.lnposterior_batch(candidates, data, pool);

    REQUIRE(priors.size() == 16);
    for (Eigen::Index i = 0; i < candidates.rows(); ++i) {
        const Vector row = candidates.row(i).transpose();
        REQUIRE(priors[i] == Approx(model.lnprior(row)));
        REQUIRE(posts[i] == Approx(model.lnposterior(row, data)));
    }
}

TEST_CASE("generate_guess_is_reproducible_and_scaled") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1});

    const Matrix a = model.generate_guess(5, 1.0, 42u);
    const Matrix b = model.generate_guess(5, 1.0, 42u);
    REQUIRE(a.rows() == 5);
    REQUIRE(a.cols() == 2);
    REQUIRE(a == b);
    for (Eigen::Index r = 0; r < a.rows(); ++r) {
        REQUIRE(a(r, 0) >= 0.0);
        REQUIRE(a(r, 0) <= 1.0);
    }

    const Matrix still = model.generate_guess(3, 0.0, 1u);
    for (Eigen::Index r = 0; r < still.rows(); ++r)
        REQUIRE(Vector(still.row(r).transpose()) == model.initial_guess());

    REQUIRE_THROWS_AS(model.generate_guess(0), std::invalid_argument);
}

TEST_CASE("lnlike_checks_vector_length") {
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, with_forward());
    const Observation data(Vector::Constant(3, 0.5));

    REQUIRE_THROWS_AS(model.lnlike(Vector::Constant(3, 0.5), data), std::out_of_range);
    REQUIRE_THROWS_AS(model.lnlike(Vector::Constant(1, 0.5), data), std::out_of_range);
}

TEST_CASE("batch_evaluation_propagates_task_errors") {
    Model::Options o;
    o.forward = [](const ForwardInputs& in, const Observation& data) -> Vector {
        if (in.scatterer.find("r")->to_double() > 0.75)
            throw std::runtime_error("scattering code crashed");
        return Vector::Zero(data.size());
    };
    Model model = Model::exact_model(sphere(), OpticsSpec{1.33, 0.66, 1.0, 0.1}, o);
    const Observation data(Vector::Zero(2));

    Matrix candidates(3, 2);
    candidates << 0.2, 4.0,
                  0.9, 4.0,
                  0.3, 4.0;

    ThreadPool pool(2);
    REQUIRE_THROWS_AS(model.lnposterior_batch(candidates, data, pool), std::runtime_error);

    candidates(1, 0) = 0.4;
    REQUIRE(model.lnposterior_batch(candidates, data, pool).allFinite());
}

TEST_CASE("thread_pool_map_rethrows_after_all_tasks") {
    ThreadPool pool(3);
    std::atomic<int> ran{0};
    auto f = [&ran](std::size_t i) {
        ++ran;
        if (i == 2) throw std::invalid_argument("bad index");
        return static_cast<int>(i) * 2;
    };
    REQUIRE_THROWS_AS(pool.parallel_map(8, f), std::invalid_argument);
    REQUIRE(ran.load() == 8);

    const auto ok = pool.parallel_map(4, [](std::size_t i) { return i * i; });
    REQUIRE(ok == std::vector<std::size_t>{0, 1, 4, 9});
}

TEST_CASE("observation_subsets_keep_pixel_indices") {
    Vector v(6);
    v << 10, 11, 12, 13, 14, 15;
    const Observation data(v, Dict{{"noise_sd", 0.1}});

    const Observation s = data.subset({4, 1});
    REQUIRE(s.size() == 2);
    REQUIRE(s.full_size() == 6);
    REQUIRE(s.values()[0] == 14.0);
    REQUIRE(s.pixels() == std::vector<Eigen::Index>{4, 1});
    REQUIRE(*find(s.metadata(), "noise_sd") == Value(0.1));

    const Observation ss = s.subset({1});
    REQUIRE(ss.pixels() == std::vector<Eigen::Index>{1});
    REQUIRE(ss.values()[0] == 11.0);

    REQUIRE_THROWS_AS(data.subset({6}), std::out_of_range);
    REQUIRE_THROWS_AS(data.random_subset(7), std::invalid_argument);

    const Observation r1 = data.random_subset(3, 5u);
    const Observation r2 = data.random_subset(3, 5u);
    REQUIRE(r1.pixels() == r2.pixels());
    REQUIRE(std::is_sorted(r1.pixels().begin(), r1.pixels().end()));
    REQUIRE_FALSE(data.is_subset());
    REQUIRE(r1.is_subset());
}

TEST_CASE("lnposterior_on_a_pixel_subset") {
    std::vector<Eigen::Index> seen;
    Model::Options o;
    o.forward = [&seen](const ForwardInputs&, const Observation& data) -> Vector {
        seen = data.pixels();
        return Vector::Zero(data.size());
    };
    OpticsSpec optics{1.33, 0.66, 1.0, List{0.1, 0.1, 0.2, 0.2, 0.4, 0.4, 0.8, 0.8}};
    Model model = Model::exact_model(sphere(), optics, o);
    const Observation data(Vector::Zero(8));
    const Vector g = model.initial_guess();

    const double full = model.lnposterior(g, data);
    REQUIRE(seen.empty());

    const double part = model.lnposterior(g, data, 3);
    REQUIRE(seen.size() == 3);
    double expected = model.lnprior(g) - 1.5 * std::log(2.0 * M_PI);
    const double sd[] = {0.1, 0.1, 0.2, 0.2, 0.4, 0.4, 0.8, 0.8};
    for (auto p : seen) expected -= std::log(sd[p]);
    REQUIRE(part == Approx(expected));
    REQUIRE(part != Approx(full));

    const auto first = seen;
    model.lnposterior(g, data, 3);
    REQUIRE(seen == first);
}
