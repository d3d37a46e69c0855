#ifndef TRACEFLOW_SERIALIZATION_GEOMETRY_JSON_HPP
#define TRACEFLOW_SERIALIZATION_GEOMETRY_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/point.hpp>
#include <geometry/shapes.hpp>
#include <stdexcept>

namespace traceflow {

// Point serialization: [x, y] or [x, y, z]
inline void to_json(nlohmann::json& j, const Point& p) {
    j = nlohmann::json::array({p.x, p.y});
    if (p.z) {
        j.push_back(*p.z);
    }
}

inline void from_json(const nlohmann::json& j, Point& p) {
    if (!j.is_array() || j.size() < 2 || j.size() > 3) {
        throw std::runtime_error("Point must be an array of 2 or 3 numbers");
    }
    p.x = j[0].get<double>();
    p.y = j[1].get<double>();
    if (j.size() == 3) {
        p.z = j[2].get<double>();
    } else {
        p.z.reset();
    }
}

inline void to_json(nlohmann::json& j, const Polyline& line) {
    j = line.points;
}

inline void from_json(const nlohmann::json& j, Polyline& line) {
    line.points = j.get<std::vector<Point>>();
}

inline void to_json(nlohmann::json& j, const Envelope& env) {
    j = {
        {"xmin", env.xmin},
        {"ymin", env.ymin},
        {"xmax", env.xmax},
        {"ymax", env.ymax}
    };
}

inline void from_json(const nlohmann::json& j, Envelope& env) {
    env.xmin = j.at("xmin").get<double>();
    env.ymin = j.at("ymin").get<double>();
    env.xmax = j.at("xmax").get<double>();
    env.ymax = j.at("ymax").get<double>();
}

// Geometry variant: {"point": [...]} or {"polyline": [[...], ...]}
inline nlohmann::json geometry_to_json(const Geometry& geometry) {
    return std::visit([](const auto& g) -> nlohmann::json {
        using T = std::decay_t<decltype(g)>;

        nlohmann::json j;
        if constexpr (std::is_same_v<T, Point>) {
            j["point"] = g;
        } else if constexpr (std::is_same_v<T, Polyline>) {
            j["polyline"] = g;
        }
        return j;
    }, geometry);
}

inline Geometry geometry_from_json(const nlohmann::json& j) {
    if (j.contains("point")) {
        return j["point"].get<Point>();
    }
    if (j.contains("polyline")) {
        return j["polyline"].get<Polyline>();
    }
    throw std::runtime_error("Geometry must contain 'point' or 'polyline'");
}

}  // namespace traceflow

#endif // TRACEFLOW_SERIALIZATION_GEOMETRY_JSON_HPP
