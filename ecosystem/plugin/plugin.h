#pragma once

#include "config.h"

#include "../common/cancellation.h"
#include "../common/channel.h"
#include "../device/cache.h"
#include "../device/grouping.h"
#include "../device/reservation.h"
#include "../device/stats.h"
#include "../enumeration/backend.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gdp::plugin {

    constexpr std::string_view name = "genicam-device";
    constexpr std::string_view version = "v0.0.1";
    constexpr std::string_view api_version = "0.1.0";

    struct plugin_info {

        std::string type, name, version;
        std::vector<std::string> api_versions;
    };

    // Device plugin exposing GenICam cameras to an orchestrator.
    //
    // Configuration is not known at construction; until set_config() is called the defaults apply.
    // Every stream started by fingerprint() or stats() runs on its own thread and is stopped either
    // by its cancellation token or by destroying the plugin.
    class genicam_device {

        public:

            explicit genicam_device(std::shared_ptr<enumeration::backend> backend);
            genicam_device(const genicam_device &) = delete;
            genicam_device &operator=(const genicam_device &) = delete;
            ~genicam_device();

            plugin_info info() const;
            nlohmann::json config_schema() const;

            std::optional<std::string> set_config(const config &cfg);
            std::optional<std::string> set_config(const std::vector<uint8_t> &msgpack);

            std::shared_ptr<common::channel<device::fingerprint_event>> fingerprint(const common::cancellation_token &cancelled);
            std::shared_ptr<common::channel<device::stats_event>> stats(const common::cancellation_token &cancelled, const std::chrono::nanoseconds &interval);

            tl::expected<device::container_reservation, device::reservation_error> reserve(const std::vector<std::string> &ids) const;

            const device::cache &devices() const;
            bool enabled() const;
            std::chrono::nanoseconds period() const;

            void shutdown();

            // Number of stream threads still running. Joins the ones that have finished.
            size_t active_workers();

        private:

            struct worker {

                std::thread thread;
                std::shared_ptr<std::atomic_bool> done;
            };

            void start_worker(std::function<void()> routine);
            void reap_workers();

            const std::shared_ptr<enumeration::backend> backend;
            device::cache cache;
            std::atomic_bool enabled_ = true;
            std::atomic<int64_t> period_ns;
            std::mutex cycle_mutex;
            common::cancellation_source stopping;
            std::mutex workers_mutex;
            std::vector<worker> workers;
    };
}
