#include "path_sample.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <math/polygon.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace curveloop {

PathSample::PathSample(std::vector<Vec3> points, const Tolerance& tol)
    : points_(std::move(points)), tol_(tol) {
    if (points_.size() < 2) {
        throw InvalidArgument("PathSample needs at least 2 points, got " +
                              std::to_string(points_.size()));
    }

    const size_t segments = points_.size() - 1;
    vectors_.reserve(segments);
    lengths_.reserve(segments);
    directions_.reserve(segments);
    cumulative_.reserve(segments);

    for (size_t i = 0; i < segments; ++i) {
        Vec3 vector = points_[i + 1] - points_[i];
        double norm = vector.length();
        vectors_.push_back(vector);
        lengths_.push_back(norm);
        // Near-zero segments keep a zero direction
        directions_.push_back(norm > tol_.zero ? vector / norm : vec3::zero());
        length_ += norm;
        cumulative_.push_back(length_);
    }
}

size_t PathSample::segment_at(double distance) const {
    auto it = std::lower_bound(cumulative_.begin(), cumulative_.end(), distance);
    size_t segment = static_cast<size_t>(it - cumulative_.begin());
    return std::min(segment, lengths_.size() - 1);
}

Vec3 PathSample::sample(double distance) const {
    size_t segment = segment_at(distance);
    double offset = distance - segment_start(segment);
    return points_[segment] + directions_[segment] * offset;
}

std::vector<Vec3> PathSample::sample(const std::vector<double>& distances) const {
    std::vector<Vec3> resampled(distances.size());

    // Each query is independent and only reads immutable state
    #pragma omp parallel for schedule(static) if(distances.size() > 4096)
    for (size_t i = 0; i < distances.size(); ++i) {
        resampled[i] = sample(distances[i]);
    }

    return resampled;
}

std::vector<Vec3> PathSample::truncate(double distance) const {
    if (distance < 0.0 || distance > length_ + tol_.merge) {
        throw InvalidArgument("PathSample::truncate: distance " + std::to_string(distance) +
                              " outside path of length " + std::to_string(length_));
    }

    // Last vertex at or before distance
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), distance);
    size_t segment = std::min(static_cast<size_t>(it - cumulative_.begin()),
                              lengths_.size() - 1);
    double offset = distance - segment_start(segment);

    std::vector<Vec3> truncated(points_.begin(), points_.begin() + segment + 1);
    if (offset >= tol_.merge) {
        truncated.push_back(points_[segment] + directions_[segment] * offset);
    }

    double truncated_length = polyline_length(truncated);
    check_postcondition(std::abs(truncated_length - distance) < tol_.merge,
                        "truncated length " + std::to_string(truncated_length) +
                        " differs from requested " + std::to_string(distance));

    return truncated;
}

std::vector<Vec3> resample(const std::vector<Vec3>& points,
                           std::optional<size_t> count,
                           std::optional<double> step,
                           bool step_round,
                           const Tolerance& tol) {
    if (count.has_value() && step.has_value()) {
        throw InvalidArgument("Only step OR count can be specified");
    }
    if (!count.has_value() && !step.has_value()) {
        throw InvalidArgument("Either step or count must be specified");
    }
    if (count.has_value() && count.value() == 0) {
        throw InvalidArgument("count must be positive");
    }
    if (count.has_value() && count.value() > max_resample_count) {
        throw InvalidArgument("count " + std::to_string(count.value()) +
                              " exceeds " + std::to_string(max_resample_count) + " samples");
    }
    if (step.has_value() && !(step.value() > 0.0)) {
        throw InvalidArgument("step must be positive");
    }

    PathSample sampler(points, tol);
    const double length = sampler.length();

    if (step.has_value()) {
        double intervals = length / step.value();
        if (!(intervals < static_cast<double>(max_resample_count))) {
            throw InvalidArgument("step " + std::to_string(step.value()) +
                                  " gives too many samples over length " + std::to_string(length));
        }
    }

    if (step.has_value() && step_round) {
        if (step.value() >= length) {
            return {points.front(), points.back()};
        }
        // One more sample than intervals, spacing no larger than step
        count = static_cast<size_t>(std::ceil(length / step.value())) + 1;
    }

    std::vector<double> samples;
    if (count.has_value()) {
        const size_t n = count.value();
        samples.reserve(n);
        if (n == 1) {
            samples.push_back(0.0);
        } else {
            for (size_t i = 0; i < n; ++i) {
                samples.push_back(length * static_cast<double>(i) / static_cast<double>(n - 1));
            }
            samples.back() = length;
        }
    } else {
        for (size_t i = 0;; ++i) {
            double distance = static_cast<double>(i) * step.value();
            if (distance >= length) {
                break;
            }
            samples.push_back(distance);
        }
        if (samples.empty()) {
            samples.push_back(0.0);
        }
    }

    std::vector<Vec3> resampled = sampler.sample(samples);

    check_postcondition(resampled.front().distance_to(points.front()) < tol.merge,
                        "resampled path does not start at the first point");
    if (count.has_value() && resampled.size() > 1) {
        check_postcondition(resampled.back().distance_to(points.back()) < tol.merge,
                            "resampled path does not end at the last point");
    }

    logging::get_logger()->trace("Resampled {} points into {} (length {})",
                                 points.size(), resampled.size(), length);
    return resampled;
}

}  // namespace curveloop
