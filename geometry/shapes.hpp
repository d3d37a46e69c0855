#ifndef TRACEFLOW_GEOMETRY_SHAPES_HPP
#define TRACEFLOW_GEOMETRY_SHAPES_HPP

#include "point.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace traceflow {

struct Polyline {
    std::vector<Point> points;

    // Total planar length
    double length() const;

    // Point at a fraction [0,1] of the planar length
    Point point_at_fraction(double fraction) const;

    bool empty() const { return points.empty(); }
};

// Axis-aligned rectangle in map units
struct Envelope {
    double xmin = 0.0;
    double ymin = 0.0;
    double xmax = 0.0;
    double ymax = 0.0;

    double width() const { return xmax - xmin; }
    double height() const { return ymax - ymin; }
    Point center() const { return {(xmin + xmax) * 0.5, (ymin + ymax) * 0.5}; }

    bool contains(const Point& p) const {
        return p.x >= xmin && p.x <= xmax && p.y >= ymin && p.y <= ymax;
    }
};

using Geometry = std::variant<Point, Polyline>;

// Closest point on a segment, returned as the parameter t in [0,1]
double closest_parameter_on_segment(const Point& a, const Point& b, const Point& p);

// Fraction of the polyline length at the point closest to p.
// Z values are ignored; a polyline without length yields 0.
double fraction_along(const Polyline& line, const Point& p);

// Planar distance from p to a geometry
double distance_to(const Geometry& geometry, const Point& p);

// Representative location used for markers: the point itself or the polyline midpoint
std::optional<Point> anchor_point(const Geometry& geometry);

// Bounding envelope; nullopt for an empty polyline
std::optional<Envelope> envelope_of(const Geometry& geometry);

}  // namespace traceflow

#endif // TRACEFLOW_GEOMETRY_SHAPES_HPP
