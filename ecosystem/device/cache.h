#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace gdp::device {

    // Serial number -> connection address of every device found by the latest fingerprint cycle.
    //
    // merge() runs under exclusive access and replaces the whole content, so readers observe
    // either the previous cycle or the new one, never a mix of both.
    class cache {

        public:

            using entry = std::pair<std::string, std::string>;

            cache() = default;
            cache(const cache &) = delete;
            cache &operator=(const cache &) = delete;

            void merge(const std::vector<entry> &entries);

            std::optional<std::string> lookup(const std::string &serial_nbr) const;

            // Resolves every id against one consistent view. On failure, returns every id that is
            // not present, in request order.
            tl::expected<std::vector<entry>, std::vector<std::string>> lookup_all(const std::vector<std::string> &serial_nbrs) const;

            size_t size() const;
            std::map<std::string, std::string> snapshot() const;

        private:

            mutable std::shared_mutex mutex;
            std::map<std::string, std::string> devices;
    };
}
