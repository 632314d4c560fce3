#pragma once

#include <string>

namespace gdp::device {

    // Identity attributes of one device as read during a single fingerprint cycle.
    struct descriptor {

        const std::string device_id; // enumeration-session id, not stable across restarts
        const std::string physical_id;
        const std::string model;
        const std::string serial_nbr;
        const std::string vendor;
        const std::string address;
        const std::string protocol;
    };
}
