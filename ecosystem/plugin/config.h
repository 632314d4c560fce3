#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace gdp::plugin {

    struct config {

        bool enabled = true;
        std::string fingerprint_period = "5s";
    };

    // Schema of the plugin block in the host configuration, with defaults.
    nlohmann::json config_schema();

    // Decodes a msgpack-encoded plugin block. Missing keys keep their defaults.
    tl::expected<config, std::string> decode_config(const std::vector<uint8_t> &msgpack);
    tl::expected<config, std::string> decode_config(const nlohmann::json &doc);

    // The period must be a positive duration.
    tl::expected<std::chrono::nanoseconds, std::string> fingerprint_period(const config &cfg);

    void to_json(nlohmann::json &doc, const config &cfg);
}
