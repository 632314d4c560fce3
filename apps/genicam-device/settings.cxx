#include "settings.h"

#include "../../ecosystem/common/duration.h"

#include <fstream>
#include <sstream>
#include <utility>
#include <array>

#include <fmt/format.h>
#include <pystring.h>
#include <yaml-cpp/yaml.h>

namespace gdp::app {

    static const std::array<std::pair<std::string_view, enumeration::attribute>, 7> attribute_keys = {{
        { "id", enumeration::attribute::id },
        { "physical_id", enumeration::attribute::physical_id },
        { "model", enumeration::attribute::model },
        { "serial_nbr", enumeration::attribute::serial_nbr },
        { "vendor", enumeration::attribute::vendor },
        { "address", enumeration::attribute::address },
        { "protocol", enumeration::attribute::protocol }
    }};

    static tl::expected<enumeration::memory_backend::record, std::string> parse_device(const YAML::Node &node, const size_t &index) {
        if (!node.IsMap()) return tl::make_unexpected(fmt::format("devices[{}] must be a map", index));
        enumeration::memory_backend::record device;
        for (const auto &[key, which] : attribute_keys) {
            const auto value = node[std::string(key)];
            if (!value) continue;
            if (value.IsScalar()) device.attributes[which] = value.as<std::string>();
            else if (value.IsMap() && value["error"]) device.fail(which, value["error"].as<std::string>());
            else return tl::make_unexpected(fmt::format("devices[{}].{} must be a string or {{ error: <text> }}", index, key));
        }
        return device;
    }
}

tl::expected<gdp::app::settings, std::string> gdp::app::parse_settings(const std::string_view &yaml) {
    settings result;
    try {
        const auto root = YAML::Load(std::string(yaml));
        if (root.IsNull()) return result;
        if (!root.IsMap()) return tl::make_unexpected("settings must be a map");
        if (const auto node = root["log_level"]; node) {
            const auto level_name = pystring::lower(pystring::strip(node.as<std::string>()));
            const auto level = spdlog::level::from_str(level_name);
            if (level == spdlog::level::off && level_name != "off") return tl::make_unexpected(fmt::format("unknown log level \"{}\"", level_name));
            result.log_level = level;
        }
        if (const auto node = root["backend"]; node) {
            result.backend = pystring::lower(pystring::strip(node.as<std::string>()));
            if (result.backend != "aravis" && result.backend != "memory") return tl::make_unexpected(fmt::format("unknown backend \"{}\"", result.backend));
        }
        if (const auto node = root["plugin"]; node) {
            if (!node.IsMap()) return tl::make_unexpected("plugin must be a map");
            if (node["enabled"]) result.plugin.enabled = node["enabled"].as<bool>();
            if (node["fingerprint_period"]) result.plugin.fingerprint_period = node["fingerprint_period"].as<std::string>();
        }
        if (const auto node = root["stats_interval"]; node) result.stats_interval = node.as<std::string>();
        if (const auto node = root["devices"]; node) {
            if (!node.IsSequence()) return tl::make_unexpected("devices must be a list");
            for (size_t i = 0; i < node.size(); i++) {
                auto device = parse_device(node[i], i);
                if (!device.has_value()) return tl::make_unexpected(device.error());
                result.devices.push_back(std::move(*device));
            }
        }
    } catch (YAML::Exception &exc) {
        return tl::make_unexpected(fmt::format("invalid settings: {}", exc.what()));
    }
    if (const auto period = plugin::fingerprint_period(result.plugin); !period.has_value()) return tl::make_unexpected(period.error());
    if (const auto interval = common::parse_duration(result.stats_interval); !interval.has_value()) return tl::make_unexpected(fmt::format("failed to parse stats interval: {}", interval.error()));
    else if (interval->count() <= 0) return tl::make_unexpected("stats interval must be positive");
    return result;
}

tl::expected<gdp::app::settings, std::string> gdp::app::load_settings(const std::filesystem::path &path) {
    std::ifstream ifs(path);
    if (!ifs) return tl::make_unexpected(fmt::format("unable to open {}", path.string()));
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return parse_settings(buffer.str());
}
