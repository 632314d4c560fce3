#include "fingerprint.h"

#include "../enumeration/memory.h"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;
using namespace gdp::device;

using gdp::enumeration::attribute;
using gdp::enumeration::memory_backend;

namespace gc = gdp::common;

class FingerprintTest : public ::testing::Test {
protected:
    memory_backend backend;
    cache devices;
    std::mutex cycle;
};

TEST_F(FingerprintTest, ReadDescriptorCopiesEveryAttribute) {
    backend.set_devices({ memory_backend::record::make("A1", "camX", "10.0.0.1") });
    backend.update_device_list();
    const auto res = read_descriptor(backend, { 0 });
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->device_id, "TIS-A1");
    EXPECT_EQ(res->physical_id, "phy-A1");
    EXPECT_EQ(res->model, "camX");
    EXPECT_EQ(res->serial_nbr, "A1");
    EXPECT_EQ(res->address, "10.0.0.1");
    EXPECT_EQ(res->protocol, "GigEVision");
}

TEST_F(FingerprintTest, ReadDescriptorNamesTheFailingAttribute) {
    backend.set_devices({ memory_backend::record::make("A1", "camX", "10.0.0.1").fail(attribute::vendor, "timeout") });
    backend.update_device_list();
    const auto res = read_descriptor(backend, { 0 });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "failed to get device vendor: timeout");
}

TEST_F(FingerprintTest, DiscoverRefreshesTheBackend) {
    backend.set_devices({ memory_backend::record::make("A1", "camX", "10.0.0.1") });
    const auto found = discover(backend);
    EXPECT_EQ(backend.update_count(), 1u);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].serial_nbr, "A1");
}

TEST_F(FingerprintTest, UnreadableDeviceIsSkippedWithoutAbortingTheCycle) {
    backend.set_devices({
        memory_backend::record::make("A1", "camX", "10.0.0.1"),
        memory_backend::record::make("A2", "camX", "10.0.0.2").fail(attribute::address, "no route"),
        memory_backend::record::make("A3", "camY", "10.0.0.3")
    });
    const auto event = run_cycle(backend, devices);
    ASSERT_EQ(event.groups.size(), 2u);
    size_t members = 0;
    for (const auto &group : event.groups) {
        for (const auto &device : group.devices) {
            EXPECT_NE(device.id, "A2");
            members++;
        }
    }
    EXPECT_EQ(members, 2u);
    EXPECT_EQ(devices.lookup("A2"), std::nullopt);
    EXPECT_EQ(devices.lookup("A1"), "10.0.0.1");
    EXPECT_EQ(devices.lookup("A3"), "10.0.0.3");
}

TEST_F(FingerprintTest, DevicesWithoutSerialOrModelAreSkipped) {
    backend.set_devices({
        memory_backend::record::make("", "camX", "10.0.0.1"),
        memory_backend::record::make("A2", "", "10.0.0.2"),
        memory_backend::record::make("A3", "camX", "10.0.0.3")
    });
    const auto found = discover(backend);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].serial_nbr, "A3");
}

TEST_F(FingerprintTest, RepeatedSerialKeepsTheFirstDevice) {
    backend.set_devices({
        memory_backend::record::make("A1", "camX", "10.0.0.1"),
        memory_backend::record::make("A1", "camX", "10.0.0.99")
    });
    const auto event = run_cycle(backend, devices);
    ASSERT_EQ(event.groups.size(), 1u);
    EXPECT_EQ(event.groups[0].devices.size(), 1u);
    EXPECT_EQ(devices.lookup("A1"), "10.0.0.1");
}

TEST_F(FingerprintTest, ListFailureYieldsAnEmptyCycle) {
    backend.set_devices({ memory_backend::record::make("A1", "camX", "10.0.0.1") });
    run_cycle(backend, devices);
    ASSERT_EQ(devices.size(), 1u);
    backend.set_list_error("bus reset");
    const auto event = run_cycle(backend, devices);
    EXPECT_TRUE(event.groups.empty());
    EXPECT_EQ(devices.size(), 0u);
}

TEST_F(FingerprintTest, VanishedDevicesLeaveTheCache) {
    backend.set_devices({
        memory_backend::record::make("A1", "camX", "10.0.0.1"),
        memory_backend::record::make("A2", "camX", "10.0.0.2")
    });
    run_cycle(backend, devices);
    backend.set_devices({ memory_backend::record::make("A2", "camX", "10.0.0.2") });
    run_cycle(backend, devices);
    EXPECT_EQ(devices.lookup("A1"), std::nullopt);
    EXPECT_EQ(devices.lookup("A2"), "10.0.0.2");
}

TEST_F(FingerprintTest, PollEmitsImmediatelyAndClosesOnCancel) {
    backend.set_devices({ memory_backend::record::make("A1", "camX", "10.0.0.1") });
    gc::cancellation_source source;
    gc::channel<fingerprint_event> events;
    std::thread worker([&] { poll(backend, devices, cycle, 1h, source.token(), events); });
    const auto first = events.receive_for(5s);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->groups.size(), 1u);
    EXPECT_EQ(first->groups[0].name, "camX");
    source.cancel();
    worker.join();
    EXPECT_TRUE(events.is_closed());
    EXPECT_EQ(events.receive(), std::nullopt);
    EXPECT_EQ(backend.update_count(), 1u);
}

TEST_F(FingerprintTest, PollRepeatsOnThePeriod) {
    gc::cancellation_source source;
    gc::channel<fingerprint_event> events(64);
    std::thread worker([&] { poll(backend, devices, cycle, 10ms, source.token(), events); });
    for (int i = 0; i < 3; i++) {
        const auto event = events.receive_for(5s);
        ASSERT_TRUE(event.has_value());
        EXPECT_TRUE(event->groups.empty());
    }
    source.cancel();
    worker.join();
    EXPECT_GE(backend.update_count(), 3u);
}

TEST_F(FingerprintTest, PollStopsWithoutRunningWhenAlreadyCancelled) {
    gc::cancellation_source source;
    source.cancel();
    gc::channel<fingerprint_event> events;
    poll(backend, devices, cycle, 10ms, source.token(), events);
    EXPECT_TRUE(events.is_closed());
    EXPECT_EQ(backend.update_count(), 0u);
}

TEST_F(FingerprintTest, CyclesSharingABackendNeverMixDevices) {
    const std::vector<memory_backend::record> forward {
        memory_backend::record::make("A1", "camX", "10.0.0.1"),
        memory_backend::record::make("B1", "camY", "10.0.0.2")
    };
    const std::vector<memory_backend::record> reversed { forward[1], forward[0] };
    backend.set_devices(forward);

    std::atomic_bool running = true;
    std::atomic<size_t> mixed = 0;
    std::thread shuffler([&] {
        for (bool flip = false; running; flip = !flip) backend.set_devices(flip ? reversed : forward);
    });
    const auto cycles = [&] {
        for (int i = 0; i < 2000; i++) {
            const auto event = run_cycle(backend, devices, cycle);
            for (const auto &group : event.groups) {
                for (const auto &member : group.devices) {
                    if ((group.name == "camX") != (member.id == "TIS-A1")) mixed++;
                }
            }
            for (const auto &[serial_nbr, address] : devices.snapshot()) {
                if (serial_nbr == "A1" && address != "10.0.0.1") mixed++;
                if (serial_nbr == "B1" && address != "10.0.0.2") mixed++;
            }
        }
    };
    std::thread first(cycles), second(cycles);
    first.join();
    second.join();
    running = false;
    shuffler.join();
    EXPECT_EQ(mixed, 0u);
    EXPECT_EQ(devices.size(), 2u);
}

TEST_F(FingerprintTest, SlowCyclesDoNotQueueMissedTicks) {
    backend.set_enumeration_delay(100ms);
    gc::cancellation_source source;
    gc::channel<fingerprint_event> events(64);
    const auto started = std::chrono::steady_clock::now();
    std::thread worker([&] { poll(backend, devices, cycle, 10ms, source.token(), events); });
    ASSERT_TRUE(events.receive_for(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 400ms);
    auto previous = std::chrono::steady_clock::now();
    for (int i = 0; i < 4; i++) {
        ASSERT_TRUE(events.receive_for(5s).has_value());
        const auto now = std::chrono::steady_clock::now();
        EXPECT_GE(now - previous, 80ms);
        previous = now;
    }
    source.cancel();
    worker.join();
    EXPECT_LE(backend.update_count(), 6u);
}

TEST_F(FingerprintTest, PeriodIsMeasuredFromCycleStart) {
    backend.set_enumeration_delay(50ms);
    gc::cancellation_source source;
    gc::channel<fingerprint_event> events(64);
    std::thread worker([&] { poll(backend, devices, cycle, 100ms, source.token(), events); });
    ASSERT_TRUE(events.receive_for(5s).has_value());
    const auto baseline = backend.update_count();
    std::this_thread::sleep_for(1s);
    const auto cycles = backend.update_count() - baseline;
    source.cancel();
    worker.join();
    EXPECT_GE(cycles, 8u);
    EXPECT_LE(cycles, 11u);
}
