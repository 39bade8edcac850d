#include "Topology.hpp"
#include <algorithm>
#include <stdexcept>

bool Device::runs(const std::string& protocol) const {
    return std::find(protocols.begin(), protocols.end(), protocol) != protocols.end();
}

Topology::Topology(std::string environment, std::vector<Device> devices)
    : environment_(std::move(environment)), devices_(std::move(devices)) {

    for (const auto& device : devices_) {
        for (const auto& iface : device.interfaces) {
            InterfaceRef ref{&device, &iface, interface_keys_.size()};
            if (!by_module_id_.emplace(iface.module_id, ref.ordinal).second) {
                throw std::logic_error("Duplicate module_id in topology: " + iface.module_id);
            }
            interface_keys_.push_back(ref);
            if (iface.module) {
                optical_keys_.push_back(ref);
            }
        }
    }
}

bool Topology::contains_module_id(const std::string& module_id) const {
    return by_module_id_.count(module_id) > 0;
}

const InterfaceRef* Topology::find(const std::string& module_id) const {
    auto it = by_module_id_.find(module_id);
    if (it == by_module_id_.end()) return nullptr;
    return &interface_keys_[it->second];
}

std::vector<std::string> Topology::module_ids() const {
    std::vector<std::string> ids;
    ids.reserve(interface_keys_.size());
    for (const auto& ref : interface_keys_) {
        ids.push_back(ref.interface->module_id);
    }
    return ids;
}
