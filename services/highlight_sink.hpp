#ifndef TRACEFLOW_SERVICES_HIGHLIGHT_SINK_HPP
#define TRACEFLOW_SERVICES_HIGHLIGHT_SINK_HPP

#include <network/network_element.hpp>
#include <trace/trace_types.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace traceflow {

// Receives selection highlighting and trace point markers
class HighlightSink {
public:
    virtual ~HighlightSink() = default;

    // Returns false when no layer with this name is displayed
    virtual bool select_elements(const std::string& layer_name,
                                 const std::vector<NetworkElement>& elements) = 0;

    // Marker for a committed start point or barrier
    virtual void add_marker(const Geometry& location, PointType type) = 0;

    // Drop all selections and markers
    virtual void clear() = 0;
};

// Sink that keeps everything in memory; used by the CLI and the tests
class RecordingHighlightSink : public HighlightSink {
public:
    struct Marker {
        Geometry location;
        PointType type;
    };

    RecordingHighlightSink() = default;
    explicit RecordingHighlightSink(std::vector<std::string> layers)
        : layers_(std::move(layers)) {}

    bool select_elements(const std::string& layer_name,
                         const std::vector<NetworkElement>& elements) override;
    void add_marker(const Geometry& location, PointType type) override;
    void clear() override;

    const std::map<std::string, std::vector<NetworkElement>>& selections() const { return selections_; }
    const std::vector<Marker>& markers() const { return markers_; }

private:
    std::vector<std::string> layers_;  // Empty accepts any layer
    std::map<std::string, std::vector<NetworkElement>> selections_;
    std::vector<Marker> markers_;
};

}  // namespace traceflow

#endif // TRACEFLOW_SERVICES_HIGHLIGHT_SINK_HPP
