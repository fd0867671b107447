#include "holofit/Observation.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

namespace holofit {

Observation::Observation(Vector values, Dict metadata)
    : values_(std::move(values))
    , metadata_(std::move(metadata))
    , full_size_(values_.size())
{}

Observation Observation::subset(const std::vector<Eigen::Index>& pixels) const
{
    if (pixels.empty()) throw std::invalid_argument("subset: no pixels selected");

    Observation out(Vector(static_cast<Eigen::Index>(pixels.size())), metadata_);
    out.full_size_ = full_size_;
    out.pixels_.reserve(pixels.size());
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        const Eigen::Index p = pixels[i];
        if (p < 0 || p >= size())
            throw std::out_of_range("subset: pixel " + std::to_string(p) +
                                    " outside data of " + std::to_string(size()) + " points");
        out.values_[static_cast<Eigen::Index>(i)] = values_[p];
        out.pixels_.push_back(is_subset() ? pixels_[static_cast<std::size_t>(p)] : p);
    }
    return out;
}

Observation Observation::random_subset(Eigen::Index n, std::optional<unsigned> seed) const
{
    if (n < 1 || n > size())
        throw std::invalid_argument("random_subset: cannot draw " + std::to_string(n) +
                                    " of " + std::to_string(size()) + " pixels");

    std::vector<Eigen::Index> all(static_cast<std::size_t>(size()));
    std::iota(all.begin(), all.end(), Eigen::Index{0});

    std::mt19937_64 rng(seed ? *seed : std::random_device{}());
    std::vector<Eigen::Index> chosen;
    chosen.reserve(static_cast<std::size_t>(n));
    std::sample(all.begin(), all.end(), std::back_inserter(chosen), n, rng);
    return subset(chosen);
}

} // namespace holofit
