#pragma once

#include "../../ecosystem/enumeration/memory.h"
#include "../../ecosystem/plugin/config.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>
#include <tl/expected.hpp>

namespace gdp::app {

    struct settings {

        spdlog::level::level_enum log_level = spdlog::level::info;
        std::string backend = "aravis";
        plugin::config plugin;
        std::string stats_interval = "10s";
        std::vector<enumeration::memory_backend::record> devices;
    };

    tl::expected<settings, std::string> parse_settings(const std::string_view &yaml);
    tl::expected<settings, std::string> load_settings(const std::filesystem::path &path);
}
