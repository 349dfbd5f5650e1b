#ifndef CURVELOOP_ENTITIES_VERTICES_HPP
#define CURVELOOP_ENTITIES_VERTICES_HPP

#include <math/vec3.hpp>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace curveloop {

using VertexId = uint32_t;

// Indexed vertex positions shared by all entities of a drawing.
// dimension is 2 or 3; 2D positions keep z at zero.
class Vertices {
public:
    Vertices() = default;
    Vertices(std::vector<Vec3> positions, int dimension)
        : positions_(std::move(positions)), dimension_(dimension) {
        if (dimension_ != 2 && dimension_ != 3) {
            throw std::invalid_argument("Vertices: dimension must be 2 or 3");
        }
    }

    // Planar vertices from (x, y) pairs
    static Vertices planar(std::initializer_list<std::pair<double, double>> xy) {
        std::vector<Vec3> positions;
        positions.reserve(xy.size());
        for (const auto& [x, y] : xy) {
            positions.emplace_back(x, y, 0.0);
        }
        return Vertices(std::move(positions), 2);
    }

    const Vec3& at(VertexId id) const {
        if (id >= positions_.size()) {
            throw std::out_of_range("Vertices::at: invalid vertex id");
        }
        return positions_[id];
    }

    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }
    int dimension() const { return dimension_; }
    const std::vector<Vec3>& positions() const { return positions_; }

    // Positions for a list of vertex ids, in order
    std::vector<Vec3> gather(const std::vector<VertexId>& ids) const {
        std::vector<Vec3> result;
        result.reserve(ids.size());
        for (VertexId id : ids) {
            result.push_back(at(id));
        }
        return result;
    }

private:
    std::vector<Vec3> positions_;
    int dimension_ = 2;
};

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_VERTICES_HPP
