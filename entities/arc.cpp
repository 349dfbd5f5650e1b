#include "arc.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace curveloop {

Arc::Arc(std::vector<VertexId> points, bool closed)
    : Curve(std::move(points), 3), closed_(closed) {
    validate(points_);
}

void Arc::validate(const std::vector<VertexId>& points) const {
    if (points.size() != 3) {
        throw InvalidArgument("Arc needs exactly 3 points, got " +
                              std::to_string(points.size()));
    }
}

ArcCenter Arc::center(const Vertices& vertices) const {
    const Vec3& a = vertices.at(points_[0]);
    const Vec3& b = vertices.at(points_[1]);
    const Vec3& c = vertices.at(points_[2]);

    Vec3 ab = b - a;
    Vec3 ac = c - a;
    Vec3 n = ab.cross(ac);

    double n_len_sq = n.length_squared();
    if (n_len_sq <= 1e-24 * ab.length_squared() * ac.length_squared() || n_len_sq == 0.0) {
        throw InvalidArgument("Arc points are collinear");
    }

    // Circumcenter of triangle abc
    Vec3 offset = (n.cross(ab) * ac.length_squared() +
                   ac.cross(n) * ab.length_squared()) / (2.0 * n_len_sq);

    ArcCenter result;
    result.center = a + offset;
    result.radius = offset.length();
    result.normal = n / std::sqrt(n_len_sq);

    if (closed_) {
        result.span = 2.0 * std::numbers::pi;
        return result;
    }

    // a -> b -> c winds counter-clockwise around n
    Vec3 u = (a - result.center) / result.radius;
    Vec3 w = result.normal.cross(u);
    Vec3 to_end = c - result.center;
    double angle = std::atan2(to_end.dot(w), to_end.dot(u));
    if (angle <= 0.0) {
        angle += 2.0 * std::numbers::pi;
    }
    result.span = angle;
    return result;
}

std::vector<Vec3> Arc::discretize(const Vertices& vertices,
                                  double scale,
                                  const Resolution& res) const {
    ArcCenter info = center(vertices);

    // Enough sections to respect both the angle and the length limits
    double by_angle = std::ceil(info.span / res.seg_angle);
    double by_length = 0.0;
    double max_segment = scale * res.seg_frac;
    if (max_segment > 0.0) {
        by_length = std::ceil(info.radius * info.span / max_segment);
    }
    double wanted = std::min(std::max(by_angle, by_length),
                             static_cast<double>(res.max_sections));
    size_t sections = std::max<size_t>(4, static_cast<size_t>(wanted));

    const Vec3& start = vertices.at(points_[0]);
    Vec3 u = (start - info.center) / info.radius;
    Vec3 w = info.normal.cross(u);

    std::vector<Vec3> discrete;
    discrete.reserve(sections + 1);
    for (size_t i = 0; i <= sections; ++i) {
        double theta = info.span * static_cast<double>(i) / static_cast<double>(sections);
        discrete.push_back(info.center +
                           u * (info.radius * std::cos(theta)) +
                           w * (info.radius * std::sin(theta)));
    }

    // Endpoints land exactly on the defining vertices so neighbours join seamlessly
    discrete.front() = start;
    discrete.back() = closed_ ? start : vertices.at(points_[2]);

    return discrete;
}

}  // namespace curveloop
