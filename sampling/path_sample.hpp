#ifndef CURVELOOP_SAMPLING_PATH_SAMPLE_HPP
#define CURVELOOP_SAMPLING_PATH_SAMPLE_HPP

#include <math/tolerance.hpp>
#include <math/vec3.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace curveloop {

// Arc-length parameterization of a polyline. All per-segment data is
// computed once in the constructor; the object is immutable afterwards.
class PathSample {
public:
    // Throws InvalidArgument for fewer than 2 points
    explicit PathSample(std::vector<Vec3> points,
                        const Tolerance& tol = Tolerance::defaults());

    // Total length of the polyline
    double length() const { return length_; }

    // Length from the start to the end of each segment (non-decreasing)
    const std::vector<double>& cumulative() const { return cumulative_; }

    const std::vector<Vec3>& points() const { return points_; }

    // Per-segment displacement, length and unit direction
    const std::vector<Vec3>& vectors() const { return vectors_; }
    const std::vector<double>& lengths() const { return lengths_; }
    const std::vector<Vec3>& directions() const { return directions_; }
    size_t segment_count() const { return lengths_.size(); }

    // Points at the given distances along the path, in input order.
    // Distances past the end extrapolate along the last segment.
    std::vector<Vec3> sample(const std::vector<double>& distances) const;
    Vec3 sample(double distance) const;

    // The path cut off at distance: the original vertices up to distance
    // plus one new end point, unless a vertex already sits within merge
    // tolerance of the cut.
    // Throws InvalidArgument for distances outside [0, length].
    std::vector<Vec3> truncate(double distance) const;

private:
    // Segment containing distance
    size_t segment_at(double distance) const;
    double segment_start(size_t segment) const {
        return segment == 0 ? 0.0 : cumulative_[segment - 1];
    }

    std::vector<Vec3> points_;
    std::vector<Vec3> vectors_;
    std::vector<double> lengths_;
    std::vector<Vec3> directions_;
    std::vector<double> cumulative_;
    double length_ = 0.0;
    Tolerance tol_;
};

// Most samples resample will produce
constexpr size_t max_resample_count = size_t{1} << 26;

// Resample a polyline so consecutive samples are equally far apart along it.
// Exactly one of count and step must be given.
//
// count: that many samples from start to end, both included.
// step: samples every step; with step_round the step shrinks so the samples
// also land exactly on the end, otherwise the end is not included.
//
// Original vertices are generally not part of the result, so corners get cut.
// Throws InvalidArgument for both/neither of count and step, count == 0,
// step <= 0, or more than max_resample_count samples.
std::vector<Vec3> resample(const std::vector<Vec3>& points,
                           std::optional<size_t> count = std::nullopt,
                           std::optional<double> step = std::nullopt,
                           bool step_round = true,
                           const Tolerance& tol = Tolerance::defaults());

}  // namespace curveloop

#endif // CURVELOOP_SAMPLING_PATH_SAMPLE_HPP
