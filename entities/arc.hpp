#ifndef CURVELOOP_ENTITIES_ARC_HPP
#define CURVELOOP_ENTITIES_ARC_HPP

#include "curve.hpp"

namespace curveloop {

// Circle through the three points of an arc
struct ArcCenter {
    Vec3 center;
    double radius = 0.0;
    Vec3 normal;         // Unit normal; the arc sweeps counter-clockwise around it
    double span = 0.0;   // Swept angle from start to end (radians, in (0, 2pi])
};

// Circular arc through three vertices: start, a point on the arc, end.
// A closed arc is the full circle through the three points.
class Arc : public Curve {
public:
    explicit Arc(std::vector<VertexId> points, bool closed = false);

    std::string kind() const override { return "Arc"; }

    bool closed() const override { return closed_; }
    void set_closed(bool closed) { closed_ = closed; }

    std::vector<Vec3> discretize(const Vertices& vertices,
                                 double scale = 1.0,
                                 const Resolution& res = Resolution::defaults()) const override;

    std::unique_ptr<Curve> clone() const override {
        return std::make_unique<Arc>(*this);
    }

    // Center, radius and swept angle; throws InvalidArgument for collinear points
    ArcCenter center(const Vertices& vertices) const;

protected:
    void validate(const std::vector<VertexId>& points) const override;

private:
    bool closed_ = false;
};

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_ARC_HPP
