#include "shapes.hpp"
#include <algorithm>
#include <limits>
#include <type_traits>

namespace traceflow {

double Polyline::length() const {
    double total = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        total += points[i - 1].distance_to(points[i]);
    }
    return total;
}

Point Polyline::point_at_fraction(double fraction) const {
    if (points.empty()) {
        return {};
    }
    if (points.size() == 1) {
        return points.front().flattened();
    }

    double target = std::clamp(fraction, 0.0, 1.0) * length();
    double walked = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        double seg = points[i - 1].distance_to(points[i]);
        if (walked + seg >= target && seg > 0.0) {
            return lerp(points[i - 1].flattened(), points[i].flattened(), (target - walked) / seg);
        }
        walked += seg;
    }
    return points.back().flattened();
}

double closest_parameter_on_segment(const Point& a, const Point& b, const Point& p) {
    Point ab = b.flattened() - a.flattened();
    double len_sq = ab.length_squared();
    if (len_sq <= 0.0) {
        return 0.0;
    }
    double t = (p.flattened() - a.flattened()).dot(ab) / len_sq;
    return std::clamp(t, 0.0, 1.0);
}

double fraction_along(const Polyline& line, const Point& p) {
    double total = line.length();
    if (line.points.size() < 2 || total <= 0.0) {
        return 0.0;
    }

    double best_distance = std::numeric_limits<double>::max();
    double best_length = 0.0;
    double walked = 0.0;

    for (size_t i = 1; i < line.points.size(); ++i) {
        const Point& a = line.points[i - 1];
        const Point& b = line.points[i];
        double seg = a.distance_to(b);
        double t = closest_parameter_on_segment(a, b, p);
        Point closest = lerp(a.flattened(), b.flattened(), t);
        double d = closest.distance_to(p.flattened());
        if (d < best_distance) {
            best_distance = d;
            best_length = walked + t * seg;
        }
        walked += seg;
    }

    return std::clamp(best_length / total, 0.0, 1.0);
}

double distance_to(const Geometry& geometry, const Point& p) {
    return std::visit([&](auto&& g) -> double {
        using T = std::decay_t<decltype(g)>;

        if constexpr (std::is_same_v<T, Point>) {
            return g.distance_to(p.flattened());
        }
        else if constexpr (std::is_same_v<T, Polyline>) {
            if (g.points.empty()) {
                return std::numeric_limits<double>::max();
            }
            if (g.points.size() == 1) {
                return g.points.front().distance_to(p.flattened());
            }
            double best = std::numeric_limits<double>::max();
            for (size_t i = 1; i < g.points.size(); ++i) {
                double t = closest_parameter_on_segment(g.points[i - 1], g.points[i], p);
                Point closest = lerp(g.points[i - 1].flattened(), g.points[i].flattened(), t);
                best = std::min(best, closest.distance_to(p.flattened()));
            }
            return best;
        }
    }, geometry);
}

std::optional<Point> anchor_point(const Geometry& geometry) {
    if (const auto* point = std::get_if<Point>(&geometry)) {
        return *point;
    }
    const auto& line = std::get<Polyline>(geometry);
    if (line.empty()) {
        return std::nullopt;
    }
    return line.point_at_fraction(0.5);
}

std::optional<Envelope> envelope_of(const Geometry& geometry) {
    if (const auto* point = std::get_if<Point>(&geometry)) {
        return Envelope{point->x, point->y, point->x, point->y};
    }
    const auto& line = std::get<Polyline>(geometry);
    if (line.empty()) {
        return std::nullopt;
    }
    Envelope env{line.points[0].x, line.points[0].y, line.points[0].x, line.points[0].y};
    for (const auto& p : line.points) {
        env.xmin = std::min(env.xmin, p.x);
        env.ymin = std::min(env.ymin, p.y);
        env.xmax = std::max(env.xmax, p.x);
        env.ymax = std::max(env.ymax, p.y);
    }
    return env;
}

}  // namespace traceflow
