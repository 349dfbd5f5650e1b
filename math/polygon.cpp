#include "polygon.hpp"

namespace curveloop {

double signed_area(const std::vector<Vec3>& ring) {
    if (ring.size() < 3) {
        return 0.0;
    }
    double area = 0.0;
    for (size_t i = 0; i < ring.size(); ++i) {
        const Vec3& p1 = ring[i];
        const Vec3& p2 = ring[(i + 1) % ring.size()];
        area += p1.x * p2.y - p2.x * p1.y;
    }
    return 0.5 * area;
}

bool is_ccw(const std::vector<Vec3>& ring) {
    return signed_area(ring) > 0.0;
}

Vec3 unitize(const Vec3& v, const Tolerance& tol) {
    double len = v.length();
    if (len > tol.zero) {
        return v / len;
    }
    return vec3::zero();
}

double polyline_length(const std::vector<Vec3>& points) {
    double total = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        total += points[i].distance_to(points[i - 1]);
    }
    return total;
}

}  // namespace curveloop
