#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace gdp::enumeration {

    enum class attribute {

        id,
        physical_id,
        model,
        serial_nbr,
        vendor,
        address,
        protocol
    };

    constexpr std::array<attribute, 7> all_attributes = {
        attribute::id,
        attribute::physical_id,
        attribute::model,
        attribute::serial_nbr,
        attribute::vendor,
        attribute::address,
        attribute::protocol
    };

    std::string_view to_string(const attribute &which);

    // Enumeration-session handle. Only valid until the next update_device_list().
    struct device_handle {

        unsigned index = 0;
    };

    // Hardware enumeration interface consumed by the discovery poller.
    // Each call must be safe from any thread. Sequences of calls (a refresh followed by reads
    // through the handles it produced) are not atomic; pollers sharing a backend serialize them.
    class backend {

        public:

            virtual ~backend() = default;

            virtual std::string_view name() const = 0;

            // Best-effort rescan of the underlying bus.
            virtual void update_device_list() = 0;

            virtual tl::expected<std::vector<device_handle>, std::string> get_devices() = 0;

            virtual tl::expected<std::string, std::string> get_attribute(const device_handle &handle, const attribute &which) = 0;
    };
}
