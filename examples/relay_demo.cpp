#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "telemux.hpp"
#include "common/cli/params.hpp"
#include "common/sim/simulated_source.hpp"

using namespace telemux;
using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Console sink: prints every relayed frame with the stream name in front
// -----------------------------------------------------------------------------
class ConsoleSink {
public:
    explicit ConsoleSink(std::string name)
        : name_(std::move(name))
    {}

    bool send(std::string_view frame) noexcept {
        std::lock_guard lock(print_mutex());
        std::cout << "[" << name_ << "] " << frame << '\n';
        return static_cast<bool>(std::cout);
    }

    bool is_open() noexcept {
        return open_.load();
    }

    void close() noexcept {
        open_.store(false);
    }

private:
    std::string name_;
    std::atomic<bool> open_{true};

    static std::mutex& print_mutex() {
        static std::mutex m;
        return m;
    }
};

static_assert(core::relay::SinkConcept<ConsoleSink>);

using DemoHub   = Hub<examples::sim::Source>;
using DemoRelay = core::relay::Session<examples::sim::Source, ConsoleSink>;

struct Client {
    std::unique_ptr<ConsoleSink> sink;
    std::unique_ptr<DemoRelay>   relay;
    std::thread                  thread;
    core::Error                  result{core::Error::None};
};

static std::optional<std::string> find_uid(const std::vector<core::stream::Descriptor>& found, const std::string& name) {
    for (const auto& d : found) {
        if (d.name == name) return d.uid;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::relay_demo::configure(argc, argv,
        "telemux - Relay & Recording Demo\n"
        "Relays simulated streams to the console while recording one of them to disk.\n");

    std::signal(SIGINT, on_signal);

    std::cout << "=== telemux " << version() << " relay demo ===\n";
    params.dump("Parameters", std::cout);
    std::cout << "Press Ctrl+C to exit\n\n";

    // -------------------------------------------------------------
    // Hub setup
    // -------------------------------------------------------------
    examples::sim::Source source;

    HubConfig config;
    config.recording.root = params.root;
    DemoHub hub(source, config);

    std::vector<core::stream::Descriptor> found;
    const auto err = hub.resolve(1s, found);
    if (err != core::Error::None) {
        std::cerr << "Resolve failed: " << core::to_string(err) << '\n';
        return -1;
    }
    for (const auto& d : found) {
        std::cout << "Discovered: " << core::stream::to_json(d) << '\n';
    }
    std::cout << '\n';

    // -------------------------------------------------------------
    // Relay clients
    // -------------------------------------------------------------
    const std::string downsample = std::to_string(params.relay_downsample);
    std::vector<std::unique_ptr<Client>> clients;
    for (const auto& name : params.streams) {
        const auto uid = find_uid(found, name);
        if (!uid) {
            std::cerr << "Stream " << name << " not discovered\n";
            continue;
        }
        auto c = std::make_unique<Client>();
        c->sink = std::make_unique<ConsoleSink>(name);
        c->relay = std::make_unique<DemoRelay>(hub.resolver(), hub.inlets(), *c->sink, config.relay);
        c->thread = std::thread([client = c.get(), uid = *uid, downsample] {
            client->result = client->relay->run(uid, std::string_view(downsample));
        });
        clients.push_back(std::move(c));
    }

    // -------------------------------------------------------------
    // Recording
    // -------------------------------------------------------------
    std::optional<core::recording::Session> recording;
    if (!params.no_record) {
        const auto uid = find_uid(found, params.record_stream);
        core::recording::Session s;
        if (!uid) {
            std::cerr << "Stream " << params.record_stream << " not discovered\n";
        } else if (const auto rec_err = hub.start_recording(*uid, params.record_label, params.record_downsample, s);
                   rec_err != core::Error::None) {
            std::cerr << "Cannot start recording: " << core::to_string(rec_err) << '\n';
        } else {
            std::cout << "Recording started: " << core::recording::to_json(s) << "\n\n";
            recording = s;
        }
    }

    // -------------------------------------------------------------
    // Main loop
    // -------------------------------------------------------------
    const auto started = std::chrono::steady_clock::now();
    const auto run_for = std::chrono::seconds(params.duration_seconds);
    const auto record_for = std::chrono::seconds(params.record_seconds);

    auto stop_recording = [&] {
        if (!recording || !recording->active) return;
        core::recording::Session s;
        const auto stop_err = hub.stop_recording(recording->id, s);
        if (stop_err != core::Error::None) {
            std::cerr << "Recording " << recording->id << " stopped with error: " << core::to_string(stop_err) << '\n';
        }
        recording = s;
        std::cout << "\nRecording stopped: " << core::recording::to_json(s) << '\n'
                  << "Archive: " << s.archive_path.string() << " (download as " << s.download_name() << ")\n\n";
    };

    while (running.load()) {
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (params.duration_seconds > 0 && elapsed >= run_for) {
            break;
        }
        if (elapsed >= record_for) {
            stop_recording();
        }
        std::this_thread::sleep_for(100ms);
    }

    // -------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------
    stop_recording();

    for (const auto& name : hub.inlets().active_inlets()) {
        hub.inlets().telemetry_dump(name, std::cout);
    }

    for (auto& c : clients) {
        c->relay->request_stop();
    }
    for (auto& c : clients) {
        c->thread.join();
        c->relay->telemetry().debug_dump(std::cout);
        std::cout << "  Exit status           : " << core::to_string(c->result) << '\n';
    }

    std::cout << "\nRecordings:\n";
    for (const auto& s : hub.recordings()) {
        std::cout << "  " << core::recording::to_json(s) << '\n';
    }

    std::cout << "\n[SUCCESS] Clean shutdown\n";
    return 0;
}
