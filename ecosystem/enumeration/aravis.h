#pragma once

#include "backend.h"

#include <mutex>

namespace gdp::enumeration {

    // GenICam camera enumeration through the Aravis library.
    class aravis_backend : public backend {

        public:

            aravis_backend();
            aravis_backend(const aravis_backend &) = delete;
            aravis_backend &operator=(const aravis_backend &) = delete;
            ~aravis_backend() override;

            std::string_view name() const override;
            void update_device_list() override;
            tl::expected<std::vector<device_handle>, std::string> get_devices() override;
            tl::expected<std::string, std::string> get_attribute(const device_handle &handle, const attribute &which) override;

        private:

            std::mutex mutex;
    };
}
