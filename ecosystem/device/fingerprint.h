#pragma once

#include "cache.h"
#include "descriptor.h"
#include "grouping.h"

#include "../common/cancellation.h"
#include "../common/channel.h"
#include "../enumeration/backend.h"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace gdp::device {

    tl::expected<descriptor, std::string> read_descriptor(enumeration::backend &backend, const enumeration::device_handle &handle);

    // Rescans the backend and returns every device whose attributes could all be read.
    // Unreadable devices are logged and left out. Readable devices are left out too when their serial
    // number or model is empty, or when their serial number was already seen in the same scan; such
    // devices appear in no group, so the groups cover only the devices the cache can key.
    //
    // The scan is several backend calls; callers sharing a backend must serialize whole scans,
    // since another scan's update_device_list() invalidates the handles in use.
    std::vector<descriptor> discover(enumeration::backend &backend);

    // One fingerprint cycle: discover, replace the cache content, group.
    fingerprint_event run_cycle(enumeration::backend &backend, cache &devices);

    // Same, holding `cycle` across discovery and the cache update so that cycles sharing the
    // backend and cache never interleave. Readers of the cache do not take `cycle`.
    fingerprint_event run_cycle(enumeration::backend &backend, cache &devices, std::mutex &cycle);

    // Runs fingerprint cycles under `cycle` until `cancelled` fires, then closes `events`. The first
    // cycle starts immediately; each following one starts `period` after the previous one started,
    // or right away if that cycle overran.
    void poll(enumeration::backend &backend, cache &devices, std::mutex &cycle, const std::chrono::nanoseconds &period, const common::cancellation_token &cancelled, common::channel<fingerprint_event> &events);
}
