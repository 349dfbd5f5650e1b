#ifndef CURVELOOP_MATH_TOLERANCE_HPP
#define CURVELOOP_MATH_TOLERANCE_HPP

namespace curveloop {

// Distance tolerances shared by the path code
struct Tolerance {
    double zero = 1e-12;    // Below this a length is treated as zero
    double merge = 1e-5;    // Points closer than this are the same point

    static Tolerance defaults() {
        return Tolerance{};
    }

    // Looser values for data coming from single precision sources
    static Tolerance coarse() {
        return Tolerance{
            .zero = 1e-8,
            .merge = 1e-3
        };
    }
};

}  // namespace curveloop

#endif // CURVELOOP_MATH_TOLERANCE_HPP
