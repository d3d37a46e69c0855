#include "highlight_sink.hpp"
#include <algorithm>

namespace traceflow {

bool RecordingHighlightSink::select_elements(const std::string& layer_name,
                                             const std::vector<NetworkElement>& elements) {
    if (!layers_.empty() &&
        std::find(layers_.begin(), layers_.end(), layer_name) == layers_.end()) {
        return false;
    }
    auto& selected = selections_[layer_name];
    selected.insert(selected.end(), elements.begin(), elements.end());
    return true;
}

void RecordingHighlightSink::add_marker(const Geometry& location, PointType type) {
    markers_.push_back({location, type});
}

void RecordingHighlightSink::clear() {
    selections_.clear();
    markers_.clear();
}

}  // namespace traceflow
