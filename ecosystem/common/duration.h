#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace gdp::common {

    // Parses a duration string such as "5s", "250ms", "1m30s" or "-1.5h".
    // A duration is an optional sign followed by one or more decimal numbers, each with an
    // optional fraction and a mandatory unit: "ns", "us" (or "µs"), "ms", "s", "m", "h".
    // The bare string "0" is accepted as zero.
    tl::expected<std::chrono::nanoseconds, std::string> parse_duration(const std::string_view &text);
}
