#include "memory.h"

#include <thread>

#include <fmt/format.h>

gdp::enumeration::memory_backend::record gdp::enumeration::memory_backend::record::make(const std::string_view &serial_nbr, const std::string_view &model, const std::string_view &address) {
    record device;
    device.attributes[attribute::id] = fmt::format("TIS-{}", serial_nbr);
    device.attributes[attribute::physical_id] = fmt::format("phy-{}", serial_nbr);
    device.attributes[attribute::model] = std::string(model);
    device.attributes[attribute::serial_nbr] = std::string(serial_nbr);
    device.attributes[attribute::vendor] = std::string("The Imaging Source Europe GmbH");
    device.attributes[attribute::address] = std::string(address);
    device.attributes[attribute::protocol] = std::string("GigEVision");
    return device;
}

gdp::enumeration::memory_backend::record &gdp::enumeration::memory_backend::record::fail(const attribute &which, const std::string_view &reason) {
    attributes[which] = tl::make_unexpected(std::string(reason));
    return *this;
}

std::string_view gdp::enumeration::memory_backend::name() const {
    return "memory";
}

void gdp::enumeration::memory_backend::update_device_list() {
    std::lock_guard guard(mutex);
    current = pending;
    updates++;
}

tl::expected<std::vector<gdp::enumeration::device_handle>, std::string> gdp::enumeration::memory_backend::get_devices() {
    std::chrono::milliseconds wait;
    {
        std::lock_guard guard(mutex);
        wait = delay;
    }
    if (wait.count() > 0) std::this_thread::sleep_for(wait);
    std::lock_guard guard(mutex);
    if (list_error) return tl::make_unexpected(*list_error);
    std::vector<device_handle> handles(current.size());
    for (unsigned i = 0; i < handles.size(); i++) handles[i].index = i;
    return handles;
}

tl::expected<std::string, std::string> gdp::enumeration::memory_backend::get_attribute(const device_handle &handle, const attribute &which) {
    std::lock_guard guard(mutex);
    if (handle.index >= current.size()) return tl::make_unexpected(fmt::format("no device at index {}", handle.index));
    const auto &attributes = current[handle.index].attributes;
    const auto i = attributes.find(which);
    if (i == attributes.end()) return tl::make_unexpected(fmt::format("{} is not available", to_string(which)));
    return i->second;
}

void gdp::enumeration::memory_backend::set_devices(std::vector<record> devices) {
    std::lock_guard guard(mutex);
    pending = std::move(devices);
}

void gdp::enumeration::memory_backend::set_list_error(const std::optional<std::string> &error) {
    std::lock_guard guard(mutex);
    list_error = error;
}

void gdp::enumeration::memory_backend::set_enumeration_delay(const std::chrono::milliseconds &delay) {
    std::lock_guard guard(mutex);
    this->delay = delay;
}

size_t gdp::enumeration::memory_backend::update_count() const {
    return updates;
}
