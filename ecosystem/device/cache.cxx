#include "cache.h"

#include <mutex>

void gdp::device::cache::merge(const std::vector<entry> &entries) {
    std::map<std::string, std::string> next;
    for (const auto &entry : entries) next[entry.first] = entry.second;
    std::unique_lock lock(mutex);
    devices.swap(next);
}

std::optional<std::string> gdp::device::cache::lookup(const std::string &serial_nbr) const {
    std::shared_lock lock(mutex);
    const auto i = devices.find(serial_nbr);
    if (i == devices.end()) return std::nullopt;
    return i->second;
}

tl::expected<std::vector<gdp::device::cache::entry>, std::vector<std::string>> gdp::device::cache::lookup_all(const std::vector<std::string> &serial_nbrs) const {
    std::vector<entry> found;
    std::vector<std::string> missing;
    found.reserve(serial_nbrs.size());
    {
        std::shared_lock lock(mutex);
        for (const auto &serial_nbr : serial_nbrs) {
            const auto i = devices.find(serial_nbr);
            if (i == devices.end()) missing.push_back(serial_nbr);
            else if (missing.empty()) found.emplace_back(i->first, i->second);
        }
    }
    if (!missing.empty()) return tl::make_unexpected(std::move(missing));
    return found;
}

size_t gdp::device::cache::size() const {
    std::shared_lock lock(mutex);
    return devices.size();
}

std::map<std::string, std::string> gdp::device::cache::snapshot() const {
    std::shared_lock lock(mutex);
    return devices;
}
