#ifndef CURVELOOP_SERIALIZATION_CONFIG_JSON_HPP
#define CURVELOOP_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/settings.hpp>
#include <entities/resolution.hpp>
#include <math/tolerance.hpp>
#include <math/vec3.hpp>
#include <traversal/traversal.hpp>

namespace curveloop {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

// Accepts [x, y] as well as [x, y, z]
inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.size() > 2 ? j[2].get<double>() : 0.0;
}

// Tolerance serialization
inline void to_json(nlohmann::json& j, const Tolerance& tol) {
    j = {
        {"zero", tol.zero},
        {"merge", tol.merge}
    };
}

inline void from_json(const nlohmann::json& j, Tolerance& tol) {
    Tolerance defaults = Tolerance::defaults();
    tol.zero = j.value("zero", defaults.zero);
    tol.merge = j.value("merge", defaults.merge);
}

// Resolution serialization
inline void to_json(nlohmann::json& j, const Resolution& res) {
    j = {
        {"seg_frac", res.seg_frac},
        {"seg_angle", res.seg_angle},
        {"min_sections", res.min_sections},
        {"max_sections", res.max_sections}
    };
}

inline void from_json(const nlohmann::json& j, Resolution& res) {
    Resolution defaults = Resolution::defaults();
    res.seg_frac = j.value("seg_frac", defaults.seg_frac);
    res.seg_angle = j.value("seg_angle", defaults.seg_angle);
    res.min_sections = j.value("min_sections", defaults.min_sections);
    res.max_sections = j.value("max_sections", defaults.max_sections);
}

// Settings serialization
inline void to_json(nlohmann::json& j, const Settings& settings) {
    j = {
        {"tolerance", settings.tolerance},
        {"resolution", settings.resolution}
    };
}

inline void from_json(const nlohmann::json& j, Settings& settings) {
    settings = Settings::defaults();
    if (j.contains("tolerance")) {
        settings.tolerance = j["tolerance"].get<Tolerance>();
    }
    if (j.contains("resolution")) {
        settings.resolution = j["resolution"].get<Resolution>();
    }
}

// Settings from a configuration object; missing keys keep their defaults
inline Settings settings_from_json(const nlohmann::json& j) {
    if (j.is_null()) {
        return Settings::defaults();
    }
    return j.get<Settings>();
}

// TraversalStats serialization (diagnostics output)
inline void to_json(nlohmann::json& j, const TraversalStats& stats) {
    j = {
        {"closed_entities", stats.closed_entities},
        {"cycles_found", stats.cycles_found},
        {"degenerate_cycles", stats.degenerate_cycles},
        {"duplicate_entities", stats.duplicate_entities},
        {"paths", stats.paths}
    };
}

inline void from_json(const nlohmann::json& j, TraversalStats& stats) {
    stats.closed_entities = j.value("closed_entities", size_t{0});
    stats.cycles_found = j.value("cycles_found", size_t{0});
    stats.degenerate_cycles = j.value("degenerate_cycles", size_t{0});
    stats.duplicate_entities = j.value("duplicate_entities", size_t{0});
    stats.paths = j.value("paths", size_t{0});
}

}  // namespace curveloop

#endif // CURVELOOP_SERIALIZATION_CONFIG_JSON_HPP
