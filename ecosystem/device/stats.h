#pragma once

#include "../common/cancellation.h"
#include "../common/channel.h"

#include <chrono>

namespace gdp::device {

    // Emitted once per stats interval. No device-level statistics are collected for cameras.
    struct stats_event {

        std::chrono::system_clock::time_point timestamp;
    };

    // Sends one stats_event per `interval` until `cancelled` fires, then closes `events`.
    void poll_stats(const std::chrono::nanoseconds &interval, const common::cancellation_token &cancelled, common::channel<stats_event> &events);
}
