#pragma once

#include "backend.h"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace gdp::enumeration {

    // Backend serving a device list held in memory. Used for simulated deployments and tests.
    class memory_backend : public backend {

        public:

            struct record {

                std::map<attribute, tl::expected<std::string, std::string>> attributes;

                static record make(const std::string_view &serial_nbr, const std::string_view &model, const std::string_view &address);
                record &fail(const attribute &which, const std::string_view &reason);
            };

            std::string_view name() const override;
            void update_device_list() override;
            tl::expected<std::vector<device_handle>, std::string> get_devices() override;
            tl::expected<std::string, std::string> get_attribute(const device_handle &handle, const attribute &which) override;

            // Takes effect on the next update_device_list().
            void set_devices(std::vector<record> devices);
            void set_list_error(const std::optional<std::string> &error);
            void set_enumeration_delay(const std::chrono::milliseconds &delay);

            size_t update_count() const;

        private:

            mutable std::mutex mutex;
            std::vector<record> pending;
            std::vector<record> current;
            std::optional<std::string> list_error;
            std::chrono::milliseconds delay { 0 };
            std::atomic<size_t> updates = 0;
    };
}
