#pragma once

#include "descriptor.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdp::device {

    constexpr std::string_view vendor = "tis";
    constexpr std::string_view type = "genicam";

    struct member {

        std::string id;
        bool healthy = true;
    };

    // Devices with the same vendor, type and name are interchangeable for the scheduler.
    struct device_group {

        std::string vendor, type, name;
        std::vector<member> devices;
        std::map<std::string, std::string> attributes;
    };

    // Full result of one fingerprint cycle. Zero groups means no devices were found.
    struct fingerprint_event {

        std::vector<device_group> groups;
    };

    // Returns nothing when `devices` is empty.
    std::optional<device_group> build_group(const std::string_view &name, const std::vector<const descriptor *> &devices);

    // Partitions devices by model. Groups come out in first-seen model order and members keep
    // their input order.
    std::vector<device_group> group_devices(const std::vector<descriptor> &devices);

    // Drops any group without members.
    fingerprint_event make_fingerprint_event(std::vector<device_group> groups);
}
