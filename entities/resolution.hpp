#ifndef CURVELOOP_ENTITIES_RESOLUTION_HPP
#define CURVELOOP_ENTITIES_RESOLUTION_HPP

#include <cstddef>

namespace curveloop {

// How finely curved entities are turned into line segments
struct Resolution {
    double seg_frac = 0.05;         // Max segment length as a fraction of drawing scale
    double seg_angle = 0.08;        // Max angle swept by one arc segment (radians)
    size_t min_sections = 20;       // Lower bound on sections for free-form curves
    size_t max_sections = 500;      // Upper bound on sections for any curve

    static Resolution defaults() {
        return Resolution{};
    }

    // Cheap preview quality
    static Resolution coarse() {
        return Resolution{
            .seg_frac = 0.2,
            .seg_angle = 0.3,
            .min_sections = 4,
            .max_sections = 64
        };
    }
};

}  // namespace curveloop

#endif // CURVELOOP_ENTITIES_RESOLUTION_HPP
