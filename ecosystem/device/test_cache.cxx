#include "cache.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include <fmt/format.h>

using namespace gdp::device;

TEST(Cache, LookupAfterMerge) {
    cache devices;
    EXPECT_EQ(devices.size(), 0u);
    EXPECT_EQ(devices.lookup("A1"), std::nullopt);
    devices.merge({ { "A1", "10.0.0.1" }, { "A2", "10.0.0.2" } });
    EXPECT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices.lookup("A1"), "10.0.0.1");
    EXPECT_EQ(devices.lookup("A2"), "10.0.0.2");
}

TEST(Cache, MergeReplacesPreviousCycle) {
    cache devices;
    devices.merge({ { "A1", "10.0.0.1" }, { "A2", "10.0.0.2" } });
    devices.merge({ { "A2", "10.0.0.20" }, { "A3", "10.0.0.3" } });
    EXPECT_EQ(devices.lookup("A1"), std::nullopt);
    EXPECT_EQ(devices.lookup("A2"), "10.0.0.20");
    EXPECT_EQ(devices.lookup("A3"), "10.0.0.3");
    devices.merge({ });
    EXPECT_EQ(devices.size(), 0u);
}

TEST(Cache, LookupAllReportsEveryMissingId) {
    cache devices;
    devices.merge({ { "A1", "10.0.0.1" } });
    const auto res = devices.lookup_all({ "B9", "A1", "C3" });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), (std::vector<std::string> { "B9", "C3" }));
}

TEST(Cache, LookupAllResolvesInRequestOrder) {
    cache devices;
    devices.merge({ { "A1", "10.0.0.1" }, { "A2", "10.0.0.2" } });
    const auto res = devices.lookup_all({ "A2", "A1" });
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res->size(), 2u);
    EXPECT_EQ((*res)[0], cache::entry("A2", "10.0.0.2"));
    EXPECT_EQ((*res)[1], cache::entry("A1", "10.0.0.1"));
}

// Every cycle uses a distinct address suffix; a reader must never see two suffixes at once.
TEST(Cache, ReadersNeverObserveAPartialMerge) {
    cache devices;
    const std::vector<std::string> ids = { "A", "B", "C", "D", "E", "F", "G", "H" };
    const auto cycle_entries = [&ids](const int &cycle) {
        std::vector<cache::entry> entries;
        for (const auto &id : ids) entries.emplace_back(id, fmt::format("{}@{}", id, cycle));
        return entries;
    };
    devices.merge(cycle_entries(0));
    std::atomic_bool done = false;
    std::atomic_int inconsistent = 0;
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; r++) {
        readers.emplace_back([&] {
            while (!done) {
                const auto res = devices.lookup_all(ids);
                if (!res.has_value()) {
                    inconsistent++;
                    continue;
                }
                const auto cycle = res->front().second.substr(res->front().second.find('@'));
                for (const auto &entry : *res) {
                    if (entry.second.substr(entry.second.find('@')) != cycle) inconsistent++;
                }
            }
        });
    }
    for (int cycle = 1; cycle <= 500; cycle++) devices.merge(cycle_entries(cycle));
    done = true;
    for (auto &reader : readers) reader.join();
    EXPECT_EQ(inconsistent, 0);
}
