#ifndef CURVELOOP_COMMON_SETTINGS_HPP
#define CURVELOOP_COMMON_SETTINGS_HPP

#include <entities/resolution.hpp>
#include <math/tolerance.hpp>

namespace curveloop {

// Numeric settings for a drawing
struct Settings {
    Tolerance tolerance = Tolerance::defaults();
    Resolution resolution = Resolution::defaults();

    static Settings defaults() {
        return Settings{};
    }
};

}  // namespace curveloop

#endif // CURVELOOP_COMMON_SETTINGS_HPP
