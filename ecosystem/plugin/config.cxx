#include "config.h"

#include "../common/duration.h"

#include <fmt/format.h>

nlohmann::json gdp::plugin::config_schema() {
    const config defaults;
    return {
        { "enabled", {
            { "type", "bool" },
            { "required", false },
            { "default", defaults.enabled }
        }},
        { "fingerprint_period", {
            { "type", "string" },
            { "required", false },
            { "default", defaults.fingerprint_period }
        }}
    };
}

tl::expected<gdp::plugin::config, std::string> gdp::plugin::decode_config(const std::vector<uint8_t> &msgpack) {
    if (msgpack.empty()) return config { };
    try {
        return decode_config(nlohmann::json::from_msgpack(msgpack));
    } catch (nlohmann::json::exception &exc) {
        return tl::make_unexpected(fmt::format("failed to decode plugin config: {}", exc.what()));
    }
}

tl::expected<gdp::plugin::config, std::string> gdp::plugin::decode_config(const nlohmann::json &doc) {
    config cfg;
    if (doc.is_null()) return cfg;
    if (!doc.is_object()) return tl::make_unexpected("plugin config must be an object");
    if (const auto i = doc.find("enabled"); i != doc.end() && !i->is_null()) {
        if (!i->is_boolean()) return tl::make_unexpected(fmt::format("\"enabled\" must be a bool, got {}", i->type_name()));
        cfg.enabled = i->get<bool>();
    }
    if (const auto i = doc.find("fingerprint_period"); i != doc.end() && !i->is_null()) {
        if (!i->is_string()) return tl::make_unexpected(fmt::format("\"fingerprint_period\" must be a string, got {}", i->type_name()));
        cfg.fingerprint_period = i->get<std::string>();
    }
    return cfg;
}

tl::expected<std::chrono::nanoseconds, std::string> gdp::plugin::fingerprint_period(const config &cfg) {
    const auto period = common::parse_duration(cfg.fingerprint_period);
    if (!period.has_value()) return tl::make_unexpected(fmt::format("failed to parse fingerprint period \"{}\": {}", cfg.fingerprint_period, period.error()));
    if (period->count() <= 0) return tl::make_unexpected(fmt::format("fingerprint period \"{}\" must be positive", cfg.fingerprint_period));
    return *period;
}

void gdp::plugin::to_json(nlohmann::json &doc, const config &cfg) {
    doc = {
        { "enabled", cfg.enabled },
        { "fingerprint_period", cfg.fingerprint_period }
    };
}
