#ifndef CURVELOOP_ENTITIES_CURVE_HPP
#define CURVELOOP_ENTITIES_CURVE_HPP

#include "vertices.hpp"
#include "resolution.hpp"
#include <math/vec3.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace curveloop {

using EntityId = uint32_t;
using NodePair = std::pair<VertexId, VertexId>;

// Abstract curve primitive defined by an ordered list of vertex ids.
// The order of points() is the traversal direction; path resolution
// reverses it in place so loops can be walked without flipping entities.
class Curve {
public:
    virtual ~Curve() = default;

    // Short type name ("Line", "Arc", ...)
    virtual std::string kind() const = 0;

    // A closed curve is a complete loop on its own
    virtual bool closed() const;

    // Vertex pairs this curve connects in the vertex graph
    virtual std::vector<NodePair> nodes() const;

    // Ordered points in space approximating the curve, following points().
    // scale is the overall drawing size used for relative resolution.
    virtual std::vector<Vec3> discretize(const Vertices& vertices,
                                         double scale = 1.0,
                                         const Resolution& res = Resolution::defaults()) const = 0;

    virtual std::unique_ptr<Curve> clone() const = 0;

    // First and last vertex of the curve
    NodePair end_points() const {
        return {points_.front(), points_.back()};
    }

    const std::vector<VertexId>& points() const { return points_; }
    void set_points(std::vector<VertexId> points);

    // Flip traversal direction
    void reverse();

protected:
    Curve(std::vector<VertexId> points, size_t min_points);

    // Throws InvalidArgument unless points has at least min_points entries
    virtual void validate(const std::vector<VertexId>& points) const;

    std::vector<VertexId> points_;
    size_t min_points_ = 2;
};

using EntityList = std::vector<std::unique_ptr<Curve>>;

// Deep copy of an entity list
EntityList clone_entities(const EntityList& entities);

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_CURVE_HPP
