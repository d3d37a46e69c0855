#ifndef TRACEFLOW_GEOMETRY_POINT_HPP
#define TRACEFLOW_GEOMETRY_POINT_HPP

#include <cmath>
#include <optional>

namespace traceflow {

// Map location; z is carried but ignored by all planar operations
struct Point {
    double x = 0.0;
    double y = 0.0;
    std::optional<double> z;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}
    constexpr Point(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Point operator+(const Point& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Point operator-(const Point& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Point operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr double dot(const Point& other) const {
        return x * other.x + y * other.y;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Point& other) const {
        return (*this - other).length();
    }

    // Planar copy without z
    constexpr Point flattened() const {
        return {x, y};
    }

    // Comparison (exact, planar)
    constexpr bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

// Position on the screen in pixels, origin at the top-left corner
struct ScreenPoint {
    double x = 0.0;
    double y = 0.0;
};

// Linear interpolation
constexpr Point lerp(const Point& a, const Point& b, double t) {
    return a * (1.0 - t) + b * t;
}

}  // namespace traceflow

#endif // TRACEFLOW_GEOMETRY_POINT_HPP
