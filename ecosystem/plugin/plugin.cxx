#include "plugin.h"

#include "../device/fingerprint.h"
#include "../defer.h"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

namespace gdp::plugin {

    static const size_t fingerprint_backlog = 8;
    static const size_t stats_backlog = 8;
}

gdp::plugin::genicam_device::genicam_device(std::shared_ptr<enumeration::backend> backend) : backend(std::move(backend)) {
    period_ns = fingerprint_period(config { })->count();
}

gdp::plugin::genicam_device::~genicam_device() {
    shutdown();
}

gdp::plugin::plugin_info gdp::plugin::genicam_device::info() const {
    return { "device", std::string(name), std::string(version), { std::string(api_version) } };
}

nlohmann::json gdp::plugin::genicam_device::config_schema() const {
    return plugin::config_schema();
}

std::optional<std::string> gdp::plugin::genicam_device::set_config(const config &cfg) {
    const auto period = fingerprint_period(cfg);
    if (!period.has_value()) return period.error();
    period_ns = period->count();
    enabled_ = cfg.enabled;
    spdlog::info("Configured plugin: {}", nlohmann::json(cfg).dump());
    return std::nullopt;
}

std::optional<std::string> gdp::plugin::genicam_device::set_config(const std::vector<uint8_t> &msgpack) {
    const auto cfg = decode_config(msgpack);
    if (!cfg.has_value()) return cfg.error();
    return set_config(*cfg);
}

std::shared_ptr<gdp::common::channel<gdp::device::fingerprint_event>> gdp::plugin::genicam_device::fingerprint(const common::cancellation_token &cancelled) {
    auto events = std::make_shared<common::channel<device::fingerprint_event>>(fingerprint_backlog);
    const auto period = this->period();
    start_worker([this, events, period, source = std::make_shared<common::cancellation_source>(std::initializer_list<common::cancellation_token> { cancelled, stopping.token() })] {
        device::poll(*backend, cache, cycle_mutex, period, source->token(), *events);
    });
    return events;
}

std::shared_ptr<gdp::common::channel<gdp::device::stats_event>> gdp::plugin::genicam_device::stats(const common::cancellation_token &cancelled, const std::chrono::nanoseconds &interval) {
    auto events = std::make_shared<common::channel<device::stats_event>>(stats_backlog);
    if (interval.count() <= 0) {
        spdlog::error("Refusing to start stats stream with non-positive interval.");
        events->close();
        return events;
    }
    start_worker([events, interval, source = std::make_shared<common::cancellation_source>(std::initializer_list<common::cancellation_token> { cancelled, stopping.token() })] {
        device::poll_stats(interval, source->token(), *events);
    });
    return events;
}

tl::expected<gdp::device::container_reservation, gdp::device::reservation_error> gdp::plugin::genicam_device::reserve(const std::vector<std::string> &ids) const {
    return device::reserve(cache, enabled_, ids);
}

const gdp::device::cache &gdp::plugin::genicam_device::devices() const {
    return cache;
}

bool gdp::plugin::genicam_device::enabled() const {
    return enabled_;
}

std::chrono::nanoseconds gdp::plugin::genicam_device::period() const {
    return std::chrono::nanoseconds(period_ns.load());
}

void gdp::plugin::genicam_device::shutdown() {
    stopping.cancel();
    std::vector<worker> finished;
    {
        std::lock_guard guard(workers_mutex);
        finished.swap(workers);
    }
    for (auto &each : finished) {
        if (each.thread.joinable()) each.thread.join();
    }
    if (!finished.empty()) spdlog::debug("Shut down {} plugin worker(s).", finished.size());
}

size_t gdp::plugin::genicam_device::active_workers() {
    std::lock_guard guard(workers_mutex);
    reap_workers();
    return workers.size();
}

void gdp::plugin::genicam_device::start_worker(std::function<void()> routine) {
    std::lock_guard guard(workers_mutex);
    reap_workers();
    auto done = std::make_shared<std::atomic_bool>(false);
    workers.push_back({ std::thread([routine = std::move(routine), done] {
        DEFER(*done = true);
        routine();
    }), done });
}

// Expects workers_mutex to be held.
void gdp::plugin::genicam_device::reap_workers() {
    const auto first_done = std::stable_partition(workers.begin(), workers.end(), [](const worker &each) {
        return !each.done->load();
    });
    for (auto it = first_done; it != workers.end(); it++) {
        if (it->thread.joinable()) it->thread.join();
    }
    const auto reaped = std::distance(first_done, workers.end());
    workers.erase(first_done, workers.end());
    if (reaped > 0) spdlog::debug("Joined {} finished plugin worker(s).", reaped);
}
