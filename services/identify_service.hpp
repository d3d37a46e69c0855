#ifndef TRACEFLOW_SERVICES_IDENTIFY_SERVICE_HPP
#define TRACEFLOW_SERVICES_IDENTIFY_SERVICE_HPP

#include <network/network_element.hpp>
#include <geometry/point.hpp>
#include <string>
#include <vector>

namespace traceflow {

// Features found in one layer, nearest first
struct IdentifyLayerResult {
    std::string layer_name;
    std::vector<Feature> features;
};

// Looks up the features under a screen location
class IdentifyService {
public:
    virtual ~IdentifyService() = default;

    // Layers are ordered by relevance; tolerance is in pixels.
    // Throws on lookup failure.
    virtual std::vector<IdentifyLayerResult> identify(const ScreenPoint& screen_point,
                                                      double tolerance) = 0;
};

}  // namespace traceflow

#endif // TRACEFLOW_SERVICES_IDENTIFY_SERVICE_HPP
