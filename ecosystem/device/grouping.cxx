#include "grouping.h"

#include <algorithm>
#include <unordered_map>

std::optional<gdp::device::device_group> gdp::device::build_group(const std::string_view &name, const std::vector<const descriptor *> &devices) {
    if (devices.empty()) return std::nullopt;
    device_group group;
    group.vendor = vendor;
    group.type = type;
    group.name = name;
    group.devices.reserve(devices.size());
    for (const auto device : devices) group.devices.push_back({ device->serial_nbr, true });
    return group;
}

std::vector<gdp::device::device_group> gdp::device::group_devices(const std::vector<descriptor> &devices) {
    std::vector<std::string> models;
    std::unordered_map<std::string, std::vector<const descriptor *>> by_model;
    for (const auto &device : devices) {
        auto &members = by_model[device.model];
        if (members.empty()) models.push_back(device.model);
        members.push_back(&device);
    }
    std::vector<device_group> groups;
    groups.reserve(models.size());
    for (const auto &model : models) {
        if (auto group = build_group(model, by_model[model]); group) groups.push_back(std::move(*group));
    }
    return groups;
}

gdp::device::fingerprint_event gdp::device::make_fingerprint_event(std::vector<device_group> groups) {
    groups.erase(std::remove_if(groups.begin(), groups.end(), [](const device_group &group) {
        return group.devices.empty();
    }), groups.end());
    return { std::move(groups) };
}
