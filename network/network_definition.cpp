#include "network_definition.hpp"
#include <algorithm>

namespace traceflow {

namespace {

template <typename T>
const T* find_by_name(const std::vector<T>& items, const std::string& name) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

}  // namespace

const Tier* DomainNetwork::tier(const std::string& tier_name) const {
    return find_by_name(tiers, tier_name);
}

const NetworkSource* NetworkDefinition::source(const std::string& name) const {
    return find_by_name(sources, name);
}

const AssetType* NetworkDefinition::asset_type(const std::string& name) const {
    return find_by_name(asset_types, name);
}

const DomainNetwork* NetworkDefinition::domain_network(const std::string& name) const {
    return find_by_name(domain_networks, name);
}

}  // namespace traceflow
