#ifndef CURVELOOP_ENTITIES_BEZIER_HPP
#define CURVELOOP_ENTITIES_BEZIER_HPP

#include "curve.hpp"

namespace curveloop {

// Evaluate a Bezier curve of any degree at parameter t in [0, 1]
// (de Casteljau's algorithm)
Vec3 bezier_evaluate(const std::vector<Vec3>& control_points, double t);

// Bezier curve whose control points are vertices. Only the first and
// last control points lie on the curve and connect to other entities.
class Bezier : public Curve {
public:
    explicit Bezier(std::vector<VertexId> points);

    std::string kind() const override { return "Bezier"; }

    std::vector<Vec3> discretize(const Vertices& vertices,
                                 double scale = 1.0,
                                 const Resolution& res = Resolution::defaults()) const override;

    std::unique_ptr<Curve> clone() const override {
        return std::make_unique<Bezier>(*this);
    }

    size_t degree() const { return points_.size() - 1; }
};

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_BEZIER_HPP
