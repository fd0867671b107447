#include "holofit/Prior.hpp"
#include "holofit/Errors.hpp"
#include "holofit/JsonUtils.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace holofit {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

double default_uniform_guess(double lower, double upper)
{
    if (std::isfinite(lower) && std::isfinite(upper)) return 0.5 * (lower + upper);
    if (std::isfinite(lower)) return lower;
    if (std::isfinite(upper)) return upper;
    return 0.0;
}

std::optional<std::string> name_from_json(const nlohmann::json& j)
{
    if (j.contains("name") && !j["name"].is_null())
        return j["name"].get<std::string>();
    return std::nullopt;
}

void name_to_json(nlohmann::json& j, const std::optional<std::string>& name)
{
    j["name"] = name ? nlohmann::json(*name) : nlohmann::json(nullptr);
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  Uniform                                                                  */
/* ------------------------------------------------------------------------- */
Uniform::Uniform(double lower, double upper,
                 std::optional<double> guess,
                 std::optional<std::string> name)
    : Prior(std::move(name))
    , lower_(lower)
    , upper_(upper)
    , guess_(guess ? *guess : default_uniform_guess(lower, upper))
{
    if (!(lower_ < upper_))
        throw std::invalid_argument("Uniform: lower bound must be below upper bound");
    if (guess_ < lower_ || guess_ > upper_)
        throw std::invalid_argument("Uniform: guess lies outside [lower, upper]");
}

double Uniform::lnprob(double x) const
{
    if (x < lower_ || x > upper_) return -kInf;
    const double interval = upper_ - lower_;
    return std::isfinite(interval) ? -std::log(interval) : 0.0;
}

double Uniform::sample(std::mt19937_64& rng) const
{
    if (!std::isfinite(lower_) || !std::isfinite(upper_)) return guess_;
    std::uniform_real_distribution<double> dist(lower_, upper_);
    return dist(rng);
}

bool Uniform::same_distribution(const Prior& other) const
{
    const auto* u = dynamic_cast<const Uniform*>(&other);
    return u && u->lower_ == lower_ && u->upper_ == upper_ && u->guess_ == guess_;
}

PriorPtr Uniform::renamed(std::optional<std::string> name) const
{
    return std::make_shared<Uniform>(lower_, upper_, guess_, std::move(name));
}

std::string Uniform::describe() const
{
    std::ostringstream os;
    os << "Uniform(" << lower_ << ", " << upper_ << ", guess=" << guess_ << ")";
    return os.str();
}

nlohmann::json Uniform::to_json() const
{
    nlohmann::json j;
    j["kind"]  = kind();
    j["lower"] = real_to_json(lower_);
    j["upper"] = real_to_json(upper_);
    j["guess"] = real_to_json(guess_);
    name_to_json(j, name());
    return j;
}

/* ------------------------------------------------------------------------- */
/*  Gaussian                                                                 */
/* ------------------------------------------------------------------------- */
Gaussian::Gaussian(double mu, double sd, std::optional<std::string> name)
    : Prior(std::move(name)), mu_(mu), sd_(sd)
{
    if (!(sd_ > 0.0))
        throw std::invalid_argument("Gaussian: sd must be positive");
}

double Gaussian::lnprob(double x) const
{
    const double z = (x - mu_) / sd_;
    return -std::log(sd_ * std::sqrt(2.0 * M_PI)) - 0.5 * z * z;
}

double Gaussian::sample(std::mt19937_64& rng) const
{
    std::normal_distribution<double> dist(mu_, sd_);
    return dist(rng);
}

bool Gaussian::same_distribution(const Prior& other) const
{
    const auto* g = dynamic_cast<const Gaussian*>(&other);
    return g && g->mu_ == mu_ && g->sd_ == sd_;
}

PriorPtr Gaussian::renamed(std::optional<std::string> name) const
{
    return std::make_shared<Gaussian>(mu_, sd_, std::move(name));
}

std::string Gaussian::describe() const
{
    std::ostringstream os;
    os << "Gaussian(" << mu_ << ", " << sd_ << ")";
    return os.str();
}

nlohmann::json Gaussian::to_json() const
{
    nlohmann::json j;
    j["kind"] = kind();
    j["mu"]   = real_to_json(mu_);
    j["sd"]   = real_to_json(sd_);
    name_to_json(j, name());
    return j;
}

/* ------------------------------------------------------------------------- */
/*  factory                                                                  */
/* ------------------------------------------------------------------------- */
PriorPtr Prior::from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("kind"))
        throw SerializationError("prior entry without \"kind\": " + j.dump());

    const auto kind = j["kind"].get<std::string>();
    try {
        if (kind == "uniform") {
            std::optional<double> guess;
            if (j.contains("guess") && !j["guess"].is_null())
                guess = real_from_json(j["guess"]);
            return std::make_shared<Uniform>(
                j.contains("lower") ? real_from_json(j["lower"]) : -kInf,
                j.contains("upper") ? real_from_json(j["upper"]) :  kInf,
                guess, name_from_json(j));
        }
        if (kind == "gaussian") {
            return std::make_shared<Gaussian>(real_from_json(j.at("mu")),
                                              real_from_json(j.at("sd")),
                                              name_from_json(j));
        }
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("prior ") + kind + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }
    throw SerializationError("unknown prior kind '" + kind + "'");
}

} // namespace holofit
