#include "duration.h"

#include <cstdint>
#include <limits>
#include <utility>
#include <array>

#include <fmt/format.h>

namespace gdp::common {

    static const std::array<std::pair<std::string_view, uint64_t>, 8> units = {{
        { "ns", 1ull },
        { "us", 1000ull },
        { "\xC2\xB5s", 1000ull },
        { "\xCE\xBCs", 1000ull },
        { "ms", 1000ull * 1000 },
        { "s", 1000ull * 1000 * 1000 },
        { "m", 60ull * 1000 * 1000 * 1000 },
        { "h", 60ull * 60 * 1000 * 1000 * 1000 }
    }};

    static bool is_digit(const char &c) {
        return c >= '0' && c <= '9';
    }

    static std::string invalid(const std::string_view &text) {
        return fmt::format("invalid duration \"{}\"", text);
    }
}

tl::expected<std::chrono::nanoseconds, std::string> gdp::common::parse_duration(const std::string_view &text) {
    constexpr uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    auto rest = text;
    bool negative = false;
    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        negative = rest.front() == '-';
        rest.remove_prefix(1);
    }
    if (rest == "0") return std::chrono::nanoseconds(0);
    if (rest.empty()) return tl::make_unexpected(invalid(text));
    uint64_t total = 0;
    while (!rest.empty()) {
        if (!is_digit(rest.front()) && rest.front() != '.') return tl::make_unexpected(invalid(text));
        uint64_t whole = 0;
        bool has_whole = false;
        while (!rest.empty() && is_digit(rest.front())) {
            const uint64_t digit = rest.front() - '0';
            if (whole > (limit - digit) / 10) return tl::make_unexpected(invalid(text));
            whole = whole * 10 + digit;
            has_whole = true;
            rest.remove_prefix(1);
        }
        uint64_t fraction = 0;
        double fraction_scale = 1;
        bool has_fraction = false;
        if (!rest.empty() && rest.front() == '.') {
            rest.remove_prefix(1);
            while (!rest.empty() && is_digit(rest.front())) {
                // Excess fractional digits are ignored.
                if (fraction <= (limit - 9) / 10) {
                    fraction = fraction * 10 + static_cast<uint64_t>(rest.front() - '0');
                    fraction_scale *= 10;
                }
                has_fraction = true;
                rest.remove_prefix(1);
            }
        }
        if (!has_whole && !has_fraction) return tl::make_unexpected(invalid(text));
        size_t unit_length = 0;
        while (unit_length < rest.size() && rest[unit_length] != '.' && !is_digit(rest[unit_length])) unit_length++;
        if (unit_length == 0) return tl::make_unexpected(fmt::format("missing unit in duration \"{}\"", text));
        const auto unit_text = rest.substr(0, unit_length);
        rest.remove_prefix(unit_length);
        uint64_t scale = 0;
        for (const auto &unit : units) {
            if (unit.first == unit_text) {
                scale = unit.second;
                break;
            }
        }
        if (scale == 0) return tl::make_unexpected(fmt::format("unknown unit \"{}\" in duration \"{}\"", unit_text, text));
        if (whole > limit / scale) return tl::make_unexpected(invalid(text));
        uint64_t value = whole * scale;
        if (fraction > 0) {
            value += static_cast<uint64_t>(static_cast<double>(fraction) * (static_cast<double>(scale) / fraction_scale));
            if (value > limit) return tl::make_unexpected(invalid(text));
        }
        if (total > limit - value) return tl::make_unexpected(invalid(text));
        total += value;
    }
    const auto signed_total = static_cast<int64_t>(total);
    return std::chrono::nanoseconds(negative ? -signed_total : signed_total);
}
