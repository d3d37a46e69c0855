#ifndef TRACEFLOW_GEOMETRY_VIEWPORT_HPP
#define TRACEFLOW_GEOMETRY_VIEWPORT_HPP

#include "point.hpp"
#include "shapes.hpp"

namespace traceflow {

// Maps screen pixels onto the visible map envelope.
// Screen y grows downward, map y grows upward.
class MapViewport {
public:
    MapViewport() = default;
    MapViewport(const Envelope& extent, double screen_width, double screen_height);

    Point to_map(const ScreenPoint& screen) const;
    ScreenPoint to_screen(const Point& map) const;

    // Map units covered by one pixel (largest of both axes)
    double units_per_pixel() const;

    const Envelope& extent() const { return extent_; }
    double screen_width() const { return screen_width_; }
    double screen_height() const { return screen_height_; }

private:
    Envelope extent_{0.0, 0.0, 800.0, 600.0};
    double screen_width_ = 800.0;
    double screen_height_ = 600.0;
};

}  // namespace traceflow

#endif // TRACEFLOW_GEOMETRY_VIEWPORT_HPP
