#include "stats.h"

#include "../defer.h"

#include <spdlog/spdlog.h>

void gdp::device::poll_stats(const std::chrono::nanoseconds &interval, const common::cancellation_token &cancelled, common::channel<stats_event> &events) {
    DEFER({
        events.close();
        spdlog::debug("Stats worker has stopped.");
    });
    spdlog::debug("Stats worker has started (interval {}ms).", std::chrono::duration_cast<std::chrono::milliseconds>(interval).count());
    auto next = std::chrono::steady_clock::now();
    for (;;) {
        if (cancelled.wait_until(next)) return;
        next = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
        events.send({ std::chrono::system_clock::now() });
    }
}
