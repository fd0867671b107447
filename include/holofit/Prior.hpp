#pragma once
/*
 * Free parameters of a model.  A prior carries an optional stable name,
 * a starting guess and a log-density.  The mapping engine only looks at
 * identity (the address of the shared object), the name and the guess;
 * two priors constructed with identical arguments are *different*
 * parameters unless the very same object is reused.
 */

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace holofit {

class Prior;
using PriorPtr = std::shared_ptr<const Prior>;

class Prior {
public:
    virtual ~Prior() = default;

    const std::optional<std::string>& name() const { return name_; }

    virtual double guess() const = 0;
    virtual double lnprob(double x) const = 0;

    /* one random draw, used to scatter starting points around the guess */
    virtual double sample(std::mt19937_64& rng) const = 0;

    /* same kind and parameters, the name is ignored */
    virtual bool same_distribution(const Prior& other) const = 0;

    virtual PriorPtr renamed(std::optional<std::string> name) const = 0;

    virtual std::string kind() const = 0;
    virtual std::string describe() const = 0;
    virtual nlohmann::json to_json() const = 0;

    static PriorPtr from_json(const nlohmann::json& j);

protected:
    explicit Prior(std::optional<std::string> name) : name_(std::move(name)) {}

private:
    std::optional<std::string> name_;
};

/* flat density on [lower, upper]; either bound may be infinite (improper) */
class Uniform : public Prior {
public:
    Uniform(double lower, double upper,
            std::optional<double>      guess = std::nullopt,
            std::optional<std::string> name  = std::nullopt);

    double lower() const { return lower_; }
    double upper() const { return upper_; }

    double guess() const override { return guess_; }
    double lnprob(double x) const override;
    double sample(std::mt19937_64& rng) const override;
    bool same_distribution(const Prior& other) const override;
    PriorPtr renamed(std::optional<std::string> name) const override;

    std::string kind() const override { return "uniform"; }
    std::string describe() const override;
    nlohmann::json to_json() const override;

private:
    double lower_;
    double upper_;
    double guess_;
};

class Gaussian : public Prior {
public:
    Gaussian(double mu, double sd, std::optional<std::string> name = std::nullopt);

    double mu() const { return mu_; }
    double sd() const { return sd_; }

    double guess() const override { return mu_; }
    double lnprob(double x) const override;
    double sample(std::mt19937_64& rng) const override;
    bool same_distribution(const Prior& other) const override;
    PriorPtr renamed(std::optional<std::string> name) const override;

    std::string kind() const override { return "gaussian"; }
    std::string describe() const override;
    nlohmann::json to_json() const override;

private:
    double mu_;
    double sd_;
};

} // namespace holofit
