#include "bezier.hpp"
#include <math/polygon.hpp>
#include <algorithm>
#include <cmath>

namespace curveloop {

Vec3 bezier_evaluate(const std::vector<Vec3>& control_points, double t) {
    if (control_points.empty()) {
        return vec3::zero();
    }
    std::vector<Vec3> work = control_points;
    for (size_t level = work.size() - 1; level > 0; --level) {
        for (size_t i = 0; i < level; ++i) {
            work[i] = lerp(work[i], work[i + 1], t);
        }
    }
    return work[0];
}

Bezier::Bezier(std::vector<VertexId> points)
    : Curve(std::move(points), 2) {}

std::vector<Vec3> Bezier::discretize(const Vertices& vertices,
                                     double scale,
                                     const Resolution& res) const {
    std::vector<Vec3> control = vertices.gather(points_);

    // The control polygon is never shorter than the curve
    double hull_length = polyline_length(control);
    size_t sections = res.min_sections;
    double max_segment = scale * res.seg_frac;
    if (max_segment > 0.0) {
        double wanted = std::ceil(hull_length / max_segment);
        wanted = std::max(wanted, static_cast<double>(res.min_sections));
        wanted = std::min(wanted, static_cast<double>(res.max_sections));
        sections = static_cast<size_t>(wanted);
    }
    sections = std::max<size_t>(sections, 1);

    std::vector<Vec3> discrete;
    discrete.reserve(sections + 1);
    for (size_t i = 0; i <= sections; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(sections);
        discrete.push_back(bezier_evaluate(control, t));
    }

    discrete.front() = control.front();
    discrete.back() = control.back();

    return discrete;
}

}  // namespace curveloop
