#include "curve.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace curveloop {

Curve::Curve(std::vector<VertexId> points, size_t min_points)
    : points_(std::move(points)), min_points_(min_points) {
    Curve::validate(points_);
}

bool Curve::closed() const {
    return points_.size() > 2 && points_.front() == points_.back();
}

std::vector<NodePair> Curve::nodes() const {
    return {end_points()};
}

void Curve::set_points(std::vector<VertexId> points) {
    validate(points);
    points_ = std::move(points);
}

void Curve::reverse() {
    std::reverse(points_.begin(), points_.end());
}

void Curve::validate(const std::vector<VertexId>& points) const {
    if (points.size() < min_points_) {
        throw InvalidArgument("Curve needs at least " + std::to_string(min_points_) +
                              " points, got " + std::to_string(points.size()));
    }
}

EntityList clone_entities(const EntityList& entities) {
    EntityList result;
    result.reserve(entities.size());
    for (const auto& entity : entities) {
        result.push_back(entity->clone());
    }
    return result;
}

}  // namespace curveloop
