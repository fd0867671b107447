#include "holofit/ParameterRegistry.hpp"
#include "holofit/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace holofit {

ParameterRegistry::ParameterRegistry(std::vector<PriorPtr> slots,
                                     std::vector<std::string> names)
    : slots_(std::move(slots)), names_(std::move(names))
{
    if (slots_.size() != names_.size())
        throw std::invalid_argument("ParameterRegistry: slot and name counts differ");
    for (std::size_t i = 0; i < names_.size(); ++i)
        for (std::size_t k = i + 1; k < names_.size(); ++k)
            if (names_[i] == names_[k])
                throw std::invalid_argument("ParameterRegistry: duplicate name " + names_[i]);
    reindex_();
}

/* ------------------------------------------------------------------------- */
/*  registration                                                             */
/* ------------------------------------------------------------------------- */
std::size_t ParameterRegistry::register_parameter(const PriorPtr& prior,
                                                  const std::string& suggested_name)
{
    if (!prior) throw std::invalid_argument("register_parameter: null prior");

    auto it = by_identity_.find(prior.get());
    if (it != by_identity_.end()) {
        /* shared object seen again: a "scope:name" label collapses to
           "name" once nothing else is called that */
        const std::size_t index = it->second;
        const auto& stored = names_[index];
        const auto colon = stored.find(':');
        if (colon != std::string::npos) {
            std::string shared = stored.substr(colon + 1);
            if (!has_name_(shared)) names_[index] = std::move(shared);
        }
        return index;
    }

    const std::size_t index = slots_.size();
    slots_.push_back(prior);
    names_.push_back(unique_name_(prior->name() ? *prior->name() : suggested_name));
    by_identity_.emplace(prior.get(), index);
    return index;
}

std::size_t ParameterRegistry::index_of(const Prior& prior) const
{
    auto it = by_identity_.find(&prior);
    if (it == by_identity_.end())
        throw std::out_of_range("index_of: prior is not registered");
    return it->second;
}

std::optional<std::size_t> ParameterRegistry::find(const std::string& name) const
{
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - names_.begin());
}

/* ------------------------------------------------------------------------- */
/*  ties                                                                     */
/* ------------------------------------------------------------------------- */
Renumbering ParameterRegistry::merge(std::vector<std::size_t> indices,
                                     const std::optional<std::string>& new_name)
{
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    if (indices.empty()) throw TieError("no parameters to tie");

    /* ---- validate everything before touching any state ------------------ */
    for (auto i : indices)
        if (i >= slots_.size())
            throw std::out_of_range("merge: slot " + std::to_string(i) + " does not exist");

    for (auto i : indices)
        if (!slots_[i])
            throw MissingParameter("cannot tie unresolved parameter " + names_[i]);

    const Prior& first = *slots_[indices.front()];
    for (auto i : indices)
        if (!slots_[i]->same_distribution(first))
            throw TieError("cannot tie unequal parameters " + names_[i] +
                           " and " + names_[indices.front()]);

    if (new_name) {
        auto clash = find(*new_name);
        if (clash && !std::binary_search(indices.begin(), indices.end(), *clash))
            throw TieError("name " + *new_name + " is already used by another parameter");
    }

    /* ---- renumbering for every pre-merge slot ---------------------------- */
    const std::size_t survivor = indices.front();
    Renumbering renumber(slots_.size());
    std::size_t removed_below = 0;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        const bool merged = std::binary_search(indices.begin(), indices.end(), i);
        if (merged && i != survivor) {
            renumber[i] = survivor;
            ++removed_below;
        } else if (merged) {
            renumber[i] = survivor;
        } else {
            renumber[i] = i - removed_below;
        }
    }

    /* ---- shrink ---------------------------------------------------------- */
    for (auto it = indices.rbegin(); it != indices.rend() && *it != survivor; ++it) {
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(*it));
        names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    if (new_name) names_[survivor] = *new_name;

    reindex_();
    return renumber;
}

/* ------------------------------------------------------------------------- */
/*  accessors                                                                */
/* ------------------------------------------------------------------------- */
Vector ParameterRegistry::guess() const
{
    Vector g(static_cast<Eigen::Index>(slots_.size()));
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) throw MissingParameter(names_[i] + " has no prior");
        g[static_cast<Eigen::Index>(i)] = slots_[i]->guess();
    }
    return g;
}

bool ParameterRegistry::resolved() const
{
    return std::all_of(slots_.begin(), slots_.end(),
                       [](const PriorPtr& p) { return p != nullptr; });
}

/* ------------------------------------------------------------------------- */
/*  internal helpers                                                         */
/* ------------------------------------------------------------------------- */
bool ParameterRegistry::has_name_(const std::string& name) const
{
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

std::string ParameterRegistry::unique_name_(std::string candidate) const
{
    if (!has_name_(candidate)) return candidate;

    candidate += "_0";
    while (has_name_(candidate)) {
        const auto us = candidate.rfind('_');
        const int counter = std::stoi(candidate.substr(us + 1));
        candidate = candidate.substr(0, us + 1) + std::to_string(counter + 1);
    }
    return candidate;
}

void ParameterRegistry::reindex_()
{
    by_identity_.clear();
    for (std::size_t i = 0; i < slots_.size(); ++i)
        if (slots_[i]) by_identity_.emplace(slots_[i].get(), i);
}

} // namespace holofit
