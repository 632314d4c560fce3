#include "backend.h"

std::string_view gdp::enumeration::to_string(const attribute &which) {
    switch (which) {
        case attribute::id: return "device id";
        case attribute::physical_id: return "device physical id";
        case attribute::model: return "device model";
        case attribute::serial_nbr: return "device serial number";
        case attribute::vendor: return "device vendor";
        case attribute::address: return "device address";
        case attribute::protocol: return "device protocol";
    }
    return "device attribute";
}
