#ifndef CURVELOOP_MATH_VEC3_HPP
#define CURVELOOP_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>

namespace curveloop {

// Point or displacement in space. 2D data keeps z at zero.
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_ = 0.0) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // Compound assignment
    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vec3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    // Magnitude
    double length() const {
        return std::sqrt(length_squared());
    }

    // Distance to another point
    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }

    // Component access (0 = x, 1 = y, 2 = z)
    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Scalar * Vec3
constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// Linear interpolation
constexpr Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return a * (1.0 - t) + b * t;
}

// Common constants
namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace curveloop

#endif // CURVELOOP_MATH_VEC3_HPP
