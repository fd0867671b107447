#pragma once
/*
 * Book-keeping of the free parameters of one model.
 *
 * Every distinct prior *object* gets one slot in the flat parameter
 * vector; slots are numbered in order of first discovery.  Re-registering
 * the same object returns its existing slot, which is how a prior shared
 * between several positions of a configuration ends up tied.  Each slot
 * carries a unique human-readable name; collisions are resolved by a
 * numeric suffix  (x, x_0, x_1, ...).
 *
 * merge() ties slots after the fact.  It shrinks the registry and hands
 * back the old → new renumbering that every map referencing the slots
 * has to be passed through (see TieEditor).
 */

#include "Prior.hpp"
#include "Types.hpp"

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace holofit {

class ParameterRegistry {
public:
    ParameterRegistry() = default;

    /* rebuild from stored slots; a null prior marks an unresolved slot */
    ParameterRegistry(std::vector<PriorPtr> slots, std::vector<std::string> names);

    std::size_t register_parameter(const PriorPtr& prior, const std::string& suggested_name);

    /* identity lookup; throws std::out_of_range for an unregistered prior */
    std::size_t index_of(const Prior& prior) const;

    std::optional<std::size_t> find(const std::string& name) const;

    /*
     * Tie the given slots together.  All priors must have the same
     * distribution (names are ignored), otherwise TieError is thrown and
     * nothing changes.  The lowest slot survives and takes `new_name` if
     * one is given.
     */
    Renumbering merge(std::vector<std::size_t> indices,
                      const std::optional<std::string>& new_name = std::nullopt);

    std::size_t size() const { return slots_.size(); }
    bool empty() const { return slots_.empty(); }

    const std::vector<PriorPtr>&    parameters() const { return slots_; }
    const std::vector<std::string>& names()      const { return names_; }

    /* initial guess of every slot, unresolved slots throw MissingParameter */
    Vector guess() const;

    /* true when every slot holds a prior */
    bool resolved() const;

private:
    bool has_name_(const std::string& name) const;
    std::string unique_name_(std::string candidate) const;
    void reindex_();

    std::vector<PriorPtr>    slots_;
    std::vector<std::string> names_;
    ankerl::unordered_dense::map<const Prior*, std::size_t> by_identity_;
};

} // namespace holofit
