#include "json.h"

void gdp::device::to_json(nlohmann::json &doc, const member &device) {
    doc = {
        { "id", device.id },
        { "healthy", device.healthy }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const device_group &group) {
    doc = {
        { "vendor", group.vendor },
        { "type", group.type },
        { "name", group.name },
        { "devices", group.devices },
        { "attributes", group.attributes }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const fingerprint_event &event) {
    doc = {
        { "device_groups", event.groups }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const stats_event &event) {
    doc = {
        { "timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(event.timestamp.time_since_epoch()).count() },
        { "groups", nlohmann::json::object() }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const mount &mount) {
    doc = {
        { "task_path", mount.task_path },
        { "host_path", mount.host_path },
        { "read_only", mount.read_only }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const device_spec &spec) {
    doc = {
        { "task_path", spec.task_path },
        { "host_path", spec.host_path },
        { "cgroup_permissions", spec.cgroup_permissions }
    };
}

void gdp::device::to_json(nlohmann::json &doc, const container_reservation &reservation) {
    doc = {
        { "envs", reservation.envs },
        { "mounts", reservation.mounts },
        { "devices", reservation.devices }
    };
}
