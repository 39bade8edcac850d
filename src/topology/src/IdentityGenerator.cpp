#include "IdentityGenerator.hpp"
#include "StringUtils.hpp"
#include <fmt/format.h>
#include <stdexcept>

const std::vector<std::string>& CommonFieldBlock::column_names() {
    static const std::vector<std::string> names = {
        "timestamp", "module_id", "datacenter", "room", "rack",
        "device_hostname", "device_ip", "device_vendor", "interface", "speed"
    };
    return names;
}

std::string IdentityGenerator::module_id(const Device& device, const Interface& iface) {
    std::string vendor = iface.module ? iface.module->vendor : device.vendor;
    StringUtils::remove_all_spaces(vendor);
    return fmt::format("{}-{}-{}-{}-{}-{}-{}",
                       vendor, device.datacenter, device.room, device.rack,
                       device.hostname, iface.name, iface.speed);
}

CommonFieldBlock IdentityGenerator::common_fields_for(const InterfaceRef& key, Timestamp timestamp) {
    if (!key.device || !key.interface) {
        throw std::logic_error("Interface reference does not point into a topology");
    }

    const Device& device = *key.device;
    const Interface& iface = *key.interface;

    CommonFieldBlock block;
    block.timestamp = timestamp;
    block.module_id = iface.module_id;
    block.datacenter = device.datacenter;
    block.room = device.room;
    block.rack = device.rack;
    block.device_hostname = device.hostname;
    block.device_ip = device.ip;
    block.device_vendor = device.vendor;
    block.interface = iface.name;
    block.speed = iface.speed;
    return block;
}
