#include "line.hpp"

namespace curveloop {

Line::Line(std::vector<VertexId> points)
    : Curve(std::move(points), 2) {}

std::vector<NodePair> Line::nodes() const {
    std::vector<NodePair> result;
    result.reserve(points_.size() - 1);
    for (size_t i = 0; i + 1 < points_.size(); ++i) {
        result.emplace_back(points_[i], points_[i + 1]);
    }
    return result;
}

std::vector<Vec3> Line::discretize(const Vertices& vertices,
                                   double scale,
                                   const Resolution& res) const {
    (void)scale; (void)res;
    return vertices.gather(points_);
}

}  // namespace curveloop
