#pragma once
#include "Types.hpp"
#include "Value.hpp"

#include <optional>
#include <vector>

namespace holofit {

/*
 * Measured data a model is compared with: the flattened pixel values and
 * the metadata recorded with them (medium_index, illum_wavelen,
 * illum_polarization, noise_sd, ...).  The metadata is the fallback for
 * any optics quantity the model itself does not map.
 *
 * A subset keeps the indices of the pixels it was drawn from, so a
 * forward model can evaluate only those points.
 */
class Observation {
public:
    Observation(Vector values, Dict metadata = {});

    const Vector& values() const { return values_; }
    const Dict& metadata() const { return metadata_; }
    Eigen::Index size() const { return values_.size(); }

    /* pixel count of the data this was drawn from */
    Eigen::Index full_size() const { return full_size_; }
    bool is_subset() const { return !pixels_.empty(); }
    /* indices into the full data; empty when every pixel is present */
    const std::vector<Eigen::Index>& pixels() const { return pixels_; }

    /* the given pixels of this observation, in the given order */
    Observation subset(const std::vector<Eigen::Index>& pixels) const;
    /* n distinct pixels chosen at random, kept in data order */
    Observation random_subset(Eigen::Index n, std::optional<unsigned> seed = std::nullopt) const;

private:
    Vector                    values_;
    Dict                      metadata_;
    Eigen::Index              full_size_;
    std::vector<Eigen::Index> pixels_;
};

} // namespace holofit
