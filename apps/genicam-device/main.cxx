#include "settings.h"

#include "../../ecosystem/common/cancellation.h"
#include "../../ecosystem/common/duration.h"
#include "../../ecosystem/defer.h"
#include "../../ecosystem/device/json.h"
#include "../../ecosystem/enumeration/aravis.h"
#include "../../ecosystem/enumeration/memory.h"
#include "../../ecosystem/plugin/plugin.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include <fmt/format.h>
#include <pystring.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static std::mutex output_mutex;

static void emit(const nlohmann::json &doc) {
    std::lock_guard guard(output_mutex);
    fmt::print("{}\n", doc.dump());
    std::fflush(stdout);
}

static void print_usage() {
    fmt::print(stderr, "usage: {} [settings.yaml]\n\ncommands on stdin:\n  reserve <serial> [<serial>...]\n  devices\n  quit\n", gdp::plugin::name);
}

static void handle_command(gdp::plugin::genicam_device &plugin, const std::string &line, gdp::common::cancellation_source &running) {
    const auto words = [&line] {
        std::vector<std::string> parts;
        pystring::split(pystring::strip(line), parts);
        return parts;
    }();
    if (words.empty()) return;
    if (words[0] == "quit" || words[0] == "exit") {
        running.cancel();
    } else if (words[0] == "devices") {
        emit({ { "devices", plugin.devices().snapshot() } });
    } else if (words[0] == "reserve") {
        const std::vector<std::string> ids(words.begin() + 1, words.end());
        if (const auto res = plugin.reserve(ids); res.has_value()) emit({ { "reservation", *res } });
        else emit({ { "error", res.error().message() }, { "unknown_ids", res.error().unknown_ids } });
    } else spdlog::warn("Unknown command: {}", words[0]);
}

// Reads commands until stdin closes or `running` is cancelled.
static void command_loop(gdp::plugin::genicam_device &plugin, gdp::common::cancellation_source &running) {
    std::string pending;
    std::vector<char> chunk(4096);
    while (!running.is_cancelled()) {
        pollfd fd { STDIN_FILENO, POLLIN, 0 };
        const auto ready = ::poll(&fd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Unable to poll stdin: {}", std::strerror(errno));
            return;
        }
        if (ready == 0) continue;
        const auto num_bytes_read = ::read(STDIN_FILENO, chunk.data(), chunk.size());
        if (num_bytes_read <= 0) {
            spdlog::debug("Stdin closed.");
            return;
        }
        pending.append(chunk.data(), static_cast<size_t>(num_bytes_read));
        for (auto end = pending.find('\n'); end != std::string::npos; end = pending.find('\n')) {
            handle_command(plugin, pending.substr(0, end), running);
            pending.erase(0, end + 1);
        }
    }
}

int main(int argc, char **argv) {
    if (argc > 2 || (argc == 2 && (std::string_view(argv[1]) == "-h" || std::string_view(argv[1]) == "--help"))) {
        print_usage();
        return argc > 2 ? 2 : 0;
    }
    spdlog::set_default_logger(spdlog::stderr_color_mt(std::string(gdp::plugin::name)));
    const auto loaded = argc == 2 ? gdp::app::load_settings(argv[1]) : gdp::app::parse_settings("");
    if (!loaded.has_value()) {
        spdlog::critical("Unable to load settings: {}", loaded.error());
        return 1;
    }
    const auto &settings = *loaded;
    spdlog::set_level(settings.log_level);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::shared_ptr<gdp::enumeration::backend> backend;
    if (settings.backend == "memory") {
        auto memory = std::make_shared<gdp::enumeration::memory_backend>();
        memory->set_devices(settings.devices);
        backend = memory;
    } else backend = std::make_shared<gdp::enumeration::aravis_backend>();

    gdp::plugin::genicam_device plugin(backend);
    const auto info = plugin.info();
    spdlog::info("Starting {} {} ({} backend).", info.name, info.version, backend->name());
    if (const auto err = plugin.set_config(settings.plugin); err) {
        spdlog::critical("Unable to configure plugin: {}", *err);
        return 1;
    }

    gdp::common::cancellation_source running;
    std::thread signal_watcher([&signals, &running] {
        int received = 0;
        while (!running.is_cancelled()) {
            timespec timeout { 0, 200 * 1000 * 1000 };
            received = sigtimedwait(&signals, nullptr, &timeout);
            if (received == SIGINT || received == SIGTERM) {
                spdlog::info("Received signal {}, shutting down.", received);
                running.cancel();
            }
        }
    });
    DEFER({
        running.cancel();
        signal_watcher.join();
    });

    const auto fingerprints = plugin.fingerprint(running.token());
    const auto stats = plugin.stats(running.token(), *gdp::common::parse_duration(settings.stats_interval));
    std::thread fingerprint_printer([fingerprints] {
        while (const auto event = fingerprints->receive()) emit({ { "fingerprint", *event } });
    });
    std::thread stats_printer([stats] {
        while (const auto event = stats->receive()) emit({ { "stats", *event } });
    });
    DEFER({
        running.cancel();
        fingerprint_printer.join();
        stats_printer.join();
        plugin.shutdown();
    });

    command_loop(plugin, running);
    return 0;
}
