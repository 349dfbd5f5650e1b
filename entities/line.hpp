#ifndef CURVELOOP_ENTITIES_LINE_HPP
#define CURVELOOP_ENTITIES_LINE_HPP

#include "curve.hpp"

namespace curveloop {

// Straight segments through two or more vertices
class Line : public Curve {
public:
    explicit Line(std::vector<VertexId> points);

    std::string kind() const override { return "Line"; }

    // Every consecutive pair of points
    std::vector<NodePair> nodes() const override;

    std::vector<Vec3> discretize(const Vertices& vertices,
                                 double scale = 1.0,
                                 const Resolution& res = Resolution::defaults()) const override;

    std::unique_ptr<Curve> clone() const override {
        return std::make_unique<Line>(*this);
    }
};

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_LINE_HPP
