#ifndef TRACEFLOW_SERVICES_ELEMENT_FACTORY_HPP
#define TRACEFLOW_SERVICES_ELEMENT_FACTORY_HPP

#include <network/network_element.hpp>
#include <optional>
#include <string>

namespace traceflow {

// Converts identified features into network elements
class ElementFactory {
public:
    virtual ~ElementFactory() = default;

    // Kind of the network source backing a feature table, if the table is part of the network
    virtual std::optional<SourceKind> source_kind(const std::string& table_name) const = 0;

    virtual std::optional<NetworkElement> make_element(const Feature& feature) const = 0;
};

}  // namespace traceflow

#endif // TRACEFLOW_SERVICES_ELEMENT_FACTORY_HPP
