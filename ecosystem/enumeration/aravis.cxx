#include "aravis.h"

#include <arv.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

gdp::enumeration::aravis_backend::aravis_backend() {
    spdlog::debug("Using Aravis {}.{}.{} for device enumeration.", ARV_MAJOR_VERSION, ARV_MINOR_VERSION, ARV_MICRO_VERSION);
}

gdp::enumeration::aravis_backend::~aravis_backend() {
    std::lock_guard guard(mutex);
    arv_shutdown();
    spdlog::debug("Aravis has been shut down.");
}

std::string_view gdp::enumeration::aravis_backend::name() const {
    return "aravis";
}

void gdp::enumeration::aravis_backend::update_device_list() {
    std::lock_guard guard(mutex);
    arv_update_device_list();
}

tl::expected<std::vector<gdp::enumeration::device_handle>, std::string> gdp::enumeration::aravis_backend::get_devices() {
    std::lock_guard guard(mutex);
    const auto num_devices = arv_get_n_devices();
    std::vector<device_handle> handles(num_devices);
    for (unsigned i = 0; i < num_devices; i++) handles[i].index = i;
    return handles;
}

tl::expected<std::string, std::string> gdp::enumeration::aravis_backend::get_attribute(const device_handle &handle, const attribute &which) {
    std::lock_guard guard(mutex);
    const char *value = nullptr;
    switch (which) {
        case attribute::id: value = arv_get_device_id(handle.index); break;
        case attribute::physical_id: value = arv_get_device_physical_id(handle.index); break;
        case attribute::model: value = arv_get_device_model(handle.index); break;
        case attribute::serial_nbr: value = arv_get_device_serial_nbr(handle.index); break;
        case attribute::vendor: value = arv_get_device_vendor(handle.index); break;
        case attribute::address: value = arv_get_device_address(handle.index); break;
        case attribute::protocol: value = arv_get_device_protocol(handle.index); break;
    }
    if (!value) return tl::make_unexpected(fmt::format("Aravis returned no {} for device #{}", to_string(which), handle.index));
    return std::string(value);
}
