#include "viewport.hpp"
#include <algorithm>
#include <stdexcept>

namespace traceflow {

MapViewport::MapViewport(const Envelope& extent, double screen_width, double screen_height)
    : extent_(extent), screen_width_(screen_width), screen_height_(screen_height) {
    if (screen_width <= 0.0 || screen_height <= 0.0) {
        throw std::invalid_argument("Viewport screen size must be positive");
    }
    if (extent.width() <= 0.0 || extent.height() <= 0.0) {
        throw std::invalid_argument("Viewport extent must not be empty");
    }
}

Point MapViewport::to_map(const ScreenPoint& screen) const {
    double x = extent_.xmin + screen.x / screen_width_ * extent_.width();
    double y = extent_.ymax - screen.y / screen_height_ * extent_.height();
    return {x, y};
}

ScreenPoint MapViewport::to_screen(const Point& map) const {
    double x = (map.x - extent_.xmin) / extent_.width() * screen_width_;
    double y = (extent_.ymax - map.y) / extent_.height() * screen_height_;
    return {x, y};
}

double MapViewport::units_per_pixel() const {
    return std::max(extent_.width() / screen_width_, extent_.height() / screen_height_);
}

}  // namespace traceflow
