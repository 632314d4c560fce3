#pragma once

#include "grouping.h"
#include "reservation.h"
#include "stats.h"

#include <nlohmann/json.hpp>

namespace gdp::device {

    void to_json(nlohmann::json &doc, const member &device);
    void to_json(nlohmann::json &doc, const device_group &group);
    void to_json(nlohmann::json &doc, const fingerprint_event &event);
    void to_json(nlohmann::json &doc, const stats_event &event);
    void to_json(nlohmann::json &doc, const mount &mount);
    void to_json(nlohmann::json &doc, const device_spec &spec);
    void to_json(nlohmann::json &doc, const container_reservation &reservation);
}
