#include "reservation.h"

#include <set>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <pystring.h>

std::string gdp::device::reservation_error::message() const {
    switch (reason) {
        case kind::disabled: return "genicam device is not enabled";
        case kind::unknown_devices: return fmt::format("unknown device IDs: {}", pystring::join(",", unknown_ids));
    }
    return "reservation failed";
}

tl::expected<gdp::device::container_reservation, gdp::device::reservation_error> gdp::device::reserve(const cache &devices, const bool &enabled, const std::vector<std::string> &ids) {
    if (ids.empty()) return container_reservation { };
    if (!enabled) return tl::make_unexpected(reservation_error { reservation_error::kind::disabled, { } });
    std::vector<std::string> distinct;
    std::set<std::string> seen;
    for (const auto &id : ids) {
        if (seen.insert(id).second) distinct.push_back(id);
    }
    spdlog::info("Reserving device IDs: {}", pystring::join(", ", distinct));
    const auto res = devices.lookup_all(distinct);
    if (!res.has_value()) {
        reservation_error error { reservation_error::kind::unknown_devices, res.error() };
        spdlog::warn("Reservation rejected: {}", error.message());
        return tl::make_unexpected(std::move(error));
    }
    container_reservation reservation;
    for (size_t index = 0; index < res->size(); index++) {
        const auto &[serial_nbr, address] = (*res)[index];
        spdlog::info("Got device #{}: serial {} at {}", index, serial_nbr, address);
        if (index == 0) {
            reservation.envs[std::string(env_serial_nbr)] = serial_nbr;
            reservation.envs[std::string(env_address)] = address;
        }
        reservation.envs[fmt::format("{}_{}", env_serial_nbr, index)] = serial_nbr;
        reservation.envs[fmt::format("{}_{}", env_address, index)] = address;
        reservation.reserved.push_back({ serial_nbr, address });
    }
    reservation.envs[std::string(env_count)] = std::to_string(res->size());
    return reservation;
}
