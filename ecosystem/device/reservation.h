#pragma once

#include "cache.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace gdp::device {

    constexpr std::string_view env_serial_nbr = "GENICAM_DEVICE_SERIAL_NBR";
    constexpr std::string_view env_address = "GENICAM_DEVICE_ADDRESS";
    constexpr std::string_view env_count = "GENICAM_DEVICE_COUNT";

    struct mount {

        std::string task_path, host_path;
        bool read_only = false;
    };

    struct device_spec {

        std::string task_path, host_path, cgroup_permissions;
    };

    struct reserved_device {

        std::string serial_nbr, address;
    };

    // What the task driver needs to hand the devices to a workload.
    struct container_reservation {

        std::vector<reserved_device> reserved;
        std::map<std::string, std::string> envs;
        std::vector<mount> mounts;
        std::vector<device_spec> devices;
    };

    struct reservation_error {

        enum class kind {

            disabled,
            unknown_devices
        };

        kind reason;
        std::vector<std::string> unknown_ids;

        std::string message() const;
    };

    // Checks every requested serial number against `devices` under one shared lock.
    //
    // An empty request always succeeds without touching the cache. Repeated ids are reserved once.
    // GENICAM_DEVICE_SERIAL_NBR and GENICAM_DEVICE_ADDRESS describe the first reserved device;
    // GENICAM_DEVICE_SERIAL_NBR_<n> and GENICAM_DEVICE_ADDRESS_<n> describe the n-th one.
    tl::expected<container_reservation, reservation_error> reserve(const cache &devices, const bool &enabled, const std::vector<std::string> &ids);
}
