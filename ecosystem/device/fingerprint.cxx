#include "fingerprint.h"

#include "../defer.h"

#include <array>
#include <set>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

tl::expected<gdp::device::descriptor, std::string> gdp::device::read_descriptor(enumeration::backend &backend, const enumeration::device_handle &handle) {
    std::array<std::string, enumeration::all_attributes.size()> values;
    for (size_t i = 0; i < enumeration::all_attributes.size(); i++) {
        const auto which = enumeration::all_attributes[i];
        auto res = backend.get_attribute(handle, which);
        if (!res.has_value()) return tl::make_unexpected(fmt::format("failed to get {}: {}", enumeration::to_string(which), res.error()));
        values[i] = std::move(*res);
    }
    return descriptor {
        std::move(values[0]),
        std::move(values[1]),
        std::move(values[2]),
        std::move(values[3]),
        std::move(values[4]),
        std::move(values[5]),
        std::move(values[6])
    };
}

std::vector<gdp::device::descriptor> gdp::device::discover(enumeration::backend &backend) {
    backend.update_device_list();
    const auto handles = backend.get_devices();
    if (!handles.has_value()) {
        spdlog::error("Failed to get devices from {} backend: {}", backend.name(), handles.error());
        return { };
    }
    std::vector<descriptor> found;
    std::set<std::string> serial_nbrs;
    found.reserve(handles->size());
    for (const auto &handle : *handles) {
        auto res = read_descriptor(backend, handle);
        if (!res.has_value()) {
            spdlog::error("Skipping device #{}: {}", handle.index, res.error());
            continue;
        }
        if (res->serial_nbr.empty() || res->model.empty()) {
            spdlog::error("Skipping device #{} ({}): empty serial number or model", handle.index, res->device_id);
            continue;
        }
        if (!serial_nbrs.insert(res->serial_nbr).second) {
            spdlog::warn("Skipping device #{} ({}): serial number {} was already reported", handle.index, res->device_id, res->serial_nbr);
            continue;
        }
        spdlog::debug("Found device: {} (model: {}, serial: {}, address: {}, protocol: {})", res->device_id, res->model, res->serial_nbr, res->address, res->protocol);
        found.push_back(std::move(*res));
    }
    return found;
}

gdp::device::fingerprint_event gdp::device::run_cycle(enumeration::backend &backend, cache &devices) {
    const auto found = discover(backend);
    std::vector<cache::entry> entries;
    entries.reserve(found.size());
    for (const auto &device : found) entries.emplace_back(device.serial_nbr, device.address);
    devices.merge(entries);
    auto event = make_fingerprint_event(group_devices(found));
    spdlog::debug("Fingerprint cycle found {} device(s) in {} group(s).", found.size(), event.groups.size());
    return event;
}

gdp::device::fingerprint_event gdp::device::run_cycle(enumeration::backend &backend, cache &devices, std::mutex &cycle) {
    std::lock_guard guard(cycle);
    return run_cycle(backend, devices);
}

void gdp::device::poll(enumeration::backend &backend, cache &devices, std::mutex &cycle, const std::chrono::nanoseconds &period, const common::cancellation_token &cancelled, common::channel<fingerprint_event> &events) {
    DEFER({
        events.close();
        spdlog::debug("Fingerprint worker has stopped.");
    });
    spdlog::debug("Fingerprint worker has started ({} backend, period {}ms).", backend.name(), std::chrono::duration_cast<std::chrono::milliseconds>(period).count());
    auto next = std::chrono::steady_clock::now();
    for (;;) {
        if (cancelled.wait_until(next)) return;
        next = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(period);
        auto event = run_cycle(backend, devices, cycle);
        if (cancelled.is_cancelled()) return;
        const auto dropped = events.dropped();
        events.send(std::move(event));
        if (events.dropped() != dropped) spdlog::warn("Fingerprint consumer is falling behind; discarded the oldest pending event.");
    }
}
