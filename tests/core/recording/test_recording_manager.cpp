/*
===============================================================================
 recording::Manager - Unit Tests
===============================================================================

Scope:
------
Recording lifecycle driven through the Hub against an in-process source.
Every test writes below a private temporary root.

Covered Requirements:
---------------------
M1. Worked example
    - start creates the directory, metadata.json and samples.ndjson
    - sampleCount in the final metadata equals the number of data lines
    - stop builds an archive holding exactly metadata.json and samples.ndjson
    - the shared inlet is released on stop

M2. Idempotent stop
    - second stop returns the same snapshot
    - metadata.json and the archive stay byte-identical

M3. Unknown ids / uids
    - stop and get of unknown ids -> NotFound / nullopt
    - start_recording of an unresolved uid -> NotFound

M4. Downsample factors below 1 are clamped to 1

M5. Labels
    - a label names the directory and is recorded in metadata
    - an empty label is recorded as null

M6. Shared inlet and listing
    - recording and relay subscribers share one inlet
    - list() reports recordings in start order

M7. Inlet open failure leaves no session behind

M8. Destroying the Hub finalizes active recordings

M9. Write failure during a recording
    - writer_error() reports IoFailure, the session stays active
    - stop() still finalizes metadata.json and builds the archive
    - sampleCount matches the lines that reached samples.ndjson

===============================================================================
*/

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "simdjson.h"

#include "telemux/hub.hpp"
#include "lcr/log/logger.hpp"
#include "telemux/core/archive/tar_lz4.hpp"
#include "common/test_check.hpp"
#include "common/mock_source.hpp"
#include "common/temp_dir.hpp"
#include "common/file_size_limit.hpp"

using namespace telemux;
using namespace telemux::core;
using namespace std::chrono_literals;
using test::MockSource;


static std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::size_t count_lines(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

static HubConfig make_config(const std::filesystem::path& root) {
    HubConfig cfg;
    cfg.inlet.pull_timeout = 5ms;
    cfg.inlet.idle_sleep = 1ms;
    cfg.recording.root = root;
    cfg.recording.flush_lines = 8;
    cfg.recording.flush_interval = 20ms;
    cfg.recording.poll_interval = 5ms;
    return cfg;
}

static void resolve_all(Hub<MockSource>& hub) {
    std::vector<stream::Descriptor> found;
    TEST_CHECK(hub.resolve(100ms, found) == Error::None);
}


// -----------------------------------------------------------------------------
// M1/M2: Worked example and idempotent stop
// -----------------------------------------------------------------------------
void test_record_and_stop() {
    std::cout << "[TEST] Group M1/M2: record, stop, stop again\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "EEG Cap", 2));

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    recording::Session started;
    TEST_CHECK(hub.start_recording("X", "", 1, started) == Error::None);
    TEST_CHECK(started.active);
    TEST_CHECK(started.id.size() == 12);
    TEST_CHECK(started.stream_uid == "X");
    TEST_CHECK(started.stream_name == "EEG Cap");
    TEST_CHECK(!started.stopped_at.has_value());
    TEST_CHECK(started.dir.parent_path() == root.path());
    TEST_CHECK(started.dir.filename().string().find("_EEG-Cap_" + started.id) != std::string::npos);
    TEST_CHECK(std::filesystem::is_regular_file(started.metadata_path));
    TEST_CHECK(std::filesystem::is_regular_file(started.data_path));
    TEST_CHECK(hub.inlets().ref_count("X") == 1);

    // Initial metadata: no stop fields yet
    {
        simdjson::dom::parser parser;
        simdjson::dom::element root_el;
        TEST_CHECK(!parser.load(started.metadata_path.string()).get(root_el));
        std::string_view id, uid, discovery;
        TEST_CHECK(!root_el["recording"]["id"].get(id));
        TEST_CHECK(id == started.id);
        TEST_CHECK(!root_el["stream"]["uid"].get(uid));
        TEST_CHECK(uid == "X");
        TEST_CHECK(!root_el["backend"]["discovery"].get(discovery));
        TEST_CHECK(discovery == "mock-source 1.0");
        TEST_CHECK(root_el["recording"]["stoppedAt"].error() == simdjson::NO_SUCH_FIELD);
    }

    constexpr std::size_t N = 25;
    MockSource::push_sequence(*xs, N);
    TEST_CHECK(test::wait_until([&] {
        auto s = hub.recording(started.id);
        return s && s->sample_count == N;
    }));

    recording::Session stopped;
    TEST_CHECK(hub.stop_recording(started.id, stopped) == Error::None);
    TEST_CHECK(!stopped.active);
    TEST_CHECK(stopped.stopped_at.has_value());
    TEST_CHECK(*stopped.stopped_at >= stopped.started_at);
    TEST_CHECK(stopped.sample_count == N);
    TEST_CHECK(count_lines(stopped.data_path) == N);

    // Inlet released
    TEST_CHECK(hub.inlets().ref_count("X") == 0);
    TEST_CHECK(!xs->is_inlet_open());

    // Final metadata
    {
        simdjson::dom::parser parser;
        simdjson::dom::element root_el;
        TEST_CHECK(!parser.load(stopped.metadata_path.string()).get(root_el));
        std::uint64_t sample_count = 0;
        TEST_CHECK(!root_el["recording"]["sampleCount"].get(sample_count));
        TEST_CHECK(sample_count == N);
        double stopped_at = 0, duration = -1;
        TEST_CHECK(!root_el["recording"]["stoppedAt"].get(stopped_at));
        TEST_CHECK(!root_el["recording"]["durationSeconds"].get(duration));
        TEST_CHECK(duration >= 0.0);
        std::string_view fmt, t_field, stream_name;
        TEST_CHECK(!root_el["recording"]["format"]["data"].get(fmt));
        TEST_CHECK(fmt == "ndjson");
        TEST_CHECK(!root_el["recording"]["format"]["schema"]["t"].get(t_field));
        TEST_CHECK(t_field == "source_timestamp");
        // Carried over from the initial document
        TEST_CHECK(!root_el["stream"]["name"].get(stream_name));
        TEST_CHECK(stream_name == "EEG Cap");
    }

    // Archive content
    TEST_CHECK(std::filesystem::is_regular_file(stopped.archive_path));
    std::vector<archive::Entry> entries;
    TEST_CHECK(archive::read_tar_lz4(stopped.archive_path, entries) == Error::None);
    TEST_CHECK(entries.size() == 2);
    TEST_CHECK(entries[0].name == "metadata.json");
    TEST_CHECK(entries[1].name == "samples.ndjson");
    TEST_CHECK(entries[0].content == read_file(stopped.metadata_path));
    TEST_CHECK(entries[1].content == read_file(stopped.data_path));

    // M2: second stop is a no-op
    const std::string meta_before = read_file(stopped.metadata_path);
    const std::string archive_before = read_file(stopped.archive_path);

    recording::Session again;
    TEST_CHECK(hub.stop_recording(started.id, again) == Error::None);
    TEST_CHECK(again.stopped_at == stopped.stopped_at);
    TEST_CHECK(again.sample_count == stopped.sample_count);
    TEST_CHECK(!again.active);
    TEST_CHECK(read_file(stopped.metadata_path) == meta_before);
    TEST_CHECK(read_file(stopped.archive_path) == archive_before);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M3: Unknown ids
// -----------------------------------------------------------------------------
void test_unknown_ids() {
    std::cout << "[TEST] Group M3: unknown ids and uids\n";

    test::TempDir root("tm_rec");
    MockSource source;
    source.add_stream(test::make_descriptor("X", "Xstream"));

    Hub<MockSource> hub(source, make_config(root.path()));

    recording::Session s;
    // Not resolved yet
    TEST_CHECK(hub.start_recording("X", "", 1, s) == Error::NotFound);

    resolve_all(hub);
    TEST_CHECK(hub.start_recording("nope", "", 1, s) == Error::NotFound);
    TEST_CHECK(hub.stop_recording("000000000000", s) == Error::NotFound);
    TEST_CHECK(!hub.recording("000000000000").has_value());
    TEST_CHECK(hub.recorder().writer_error("000000000000") == Error::NotFound);
    TEST_CHECK(hub.recordings().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M4: Downsample clamp
// -----------------------------------------------------------------------------
void test_downsample_clamp() {
    std::cout << "[TEST] Group M4: downsample clamp\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    recording::Session zero, negative, four;
    TEST_CHECK(hub.start_recording("X", "zero", 0, zero) == Error::None);
    TEST_CHECK(hub.start_recording("X", "negative", -5, negative) == Error::None);
    TEST_CHECK(hub.start_recording("X", "four", 4, four) == Error::None);
    TEST_CHECK(zero.downsample == 1);
    TEST_CHECK(negative.downsample == 1);
    TEST_CHECK(four.downsample == 4);

    MockSource::push_sequence(*xs, 20);
    TEST_CHECK(test::wait_until([&] {
        auto a = hub.recording(zero.id);
        auto b = hub.recording(four.id);
        return a && b && a->sample_count == 20 && b->sample_count == 5;
    }));

    recording::Session done;
    TEST_CHECK(hub.stop_recording(four.id, done) == Error::None);
    TEST_CHECK(done.sample_count == 5);
    TEST_CHECK(count_lines(done.data_path) == 5);

    simdjson::dom::parser parser;
    simdjson::dom::element root_el;
    TEST_CHECK(!parser.load(done.metadata_path.string()).get(root_el));
    std::uint64_t ds = 0;
    TEST_CHECK(!root_el["recording"]["downsample"].get(ds));
    TEST_CHECK(ds == 4);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M5: Labels
// -----------------------------------------------------------------------------
void test_labels() {
    std::cout << "[TEST] Group M5: labels\n";

    test::TempDir root("tm_rec");
    MockSource source;
    source.add_stream(test::make_descriptor("X", "Xstream"));

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    recording::Session labelled, plain;
    TEST_CHECK(hub.start_recording("X", "Session A/1", 1, labelled) == Error::None);
    TEST_CHECK(hub.start_recording("X", "", 1, plain) == Error::None);

    TEST_CHECK(labelled.label == "Session A/1");
    TEST_CHECK(labelled.dir.filename().string().find("_Session-A1_") != std::string::npos);
    TEST_CHECK(plain.dir.filename().string().find("_Xstream_") != std::string::npos);

    // Download names always use the stream name
    TEST_CHECK(labelled.download_name() == "telemux_Xstream_" + labelled.id + ".tar.lz4");

    simdjson::dom::parser parser;
    simdjson::dom::element root_el;

    TEST_CHECK(!parser.load(labelled.metadata_path.string()).get(root_el));
    std::string_view label;
    TEST_CHECK(!root_el["recording"]["label"].get(label));
    TEST_CHECK(label == "Session A/1");

    TEST_CHECK(!parser.load(plain.metadata_path.string()).get(root_el));
    simdjson::dom::element label_el;
    TEST_CHECK(!root_el["recording"]["label"].get(label_el));
    TEST_CHECK(label_el.is_null());

    // Session JSON mirrors the same convention
    const std::string json = recording::to_json(plain);
    TEST_CHECK(json.find("\"label\":null") != std::string::npos);
    TEST_CHECK(json.find("\"stoppedAt\":null") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M6: Shared inlet and listing
// -----------------------------------------------------------------------------
void test_shared_inlet_and_list() {
    std::cout << "[TEST] Group M6: shared inlet and listing\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));
    source.add_stream(test::make_descriptor("Y", "Ystream"));

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    // A relay-side subscriber already holds the inlet
    inlet::Subscriber relay_queue;
    TEST_CHECK(hub.inlets().subscribe("X", *hub.resolver().get_handle("X"), 64, relay_queue) == Error::None);

    recording::Session r1, r2, r3;
    TEST_CHECK(hub.start_recording("X", "first", 1, r1) == Error::None);
    TEST_CHECK(hub.start_recording("Y", "second", 1, r2) == Error::None);
    TEST_CHECK(hub.start_recording("X", "third", 1, r3) == Error::None);

    TEST_CHECK(hub.inlets().ref_count("X") == 3);
    TEST_CHECK(xs->inlets_created.load() == 1);

    const auto all = hub.recordings();
    TEST_CHECK(all.size() == 3);
    TEST_CHECK(all[0].id == r1.id);
    TEST_CHECK(all[1].id == r2.id);
    TEST_CHECK(all[2].id == r3.id);

    recording::Session s;
    TEST_CHECK(hub.stop_recording(r1.id, s) == Error::None);
    TEST_CHECK(hub.stop_recording(r3.id, s) == Error::None);

    // Relay keeps the inlet alive
    TEST_CHECK(hub.inlets().ref_count("X") == 1);
    TEST_CHECK(xs->is_inlet_open());

    // Stopped recordings stay listed
    const auto after = hub.recordings();
    TEST_CHECK(after.size() == 3);
    TEST_CHECK(!after[0].active);
    TEST_CHECK(after[1].active);
    TEST_CHECK(!after[2].active);

    hub.inlets().unsubscribe("X", relay_queue);
    TEST_CHECK(!xs->is_inlet_open());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M7: Inlet open failure
// -----------------------------------------------------------------------------
void test_open_failure() {
    std::cout << "[TEST] Group M7: inlet open failure\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));
    xs->set_open_result(Error::ConnectionFailed);

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    recording::Session s;
    TEST_CHECK(hub.start_recording("X", "", 1, s) == Error::ConnectionFailed);
    TEST_CHECK(hub.recordings().empty());
    TEST_CHECK(hub.inlets().active_inlets().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M8: Shutdown
// -----------------------------------------------------------------------------
void test_hub_shutdown_finalizes() {
    std::cout << "[TEST] Group M8: hub shutdown finalizes recordings\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));

    recording::Session s;
    {
        Hub<MockSource> hub(source, make_config(root.path()));
        resolve_all(hub);
        TEST_CHECK(hub.start_recording("X", "", 1, s) == Error::None);
        MockSource::push_sequence(*xs, 10);
        TEST_CHECK(test::wait_until([&] { return hub.recording(s.id)->sample_count == 10; }));
    }

    TEST_CHECK(std::filesystem::is_regular_file(s.archive_path));
    TEST_CHECK(count_lines(s.data_path) == 10);
    TEST_CHECK(!xs->is_inlet_open());

    simdjson::dom::parser parser;
    simdjson::dom::element root_el;
    TEST_CHECK(!parser.load(s.metadata_path.string()).get(root_el));
    std::uint64_t sample_count = 0;
    TEST_CHECK(!root_el["recording"]["sampleCount"].get(sample_count));
    TEST_CHECK(sample_count == 10);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// M9: Write failure
// -----------------------------------------------------------------------------
void test_write_failure_then_stop() {
    std::cout << "[TEST] Group M9: write failure, then stop\n";

    test::TempDir root("tm_rec");
    MockSource source;
    auto xs = source.add_stream(test::make_descriptor("X", "Xstream"));

    Hub<MockSource> hub(source, make_config(root.path()));
    resolve_all(hub);

    recording::Session s;
    TEST_CHECK(hub.start_recording("X", "", 1, s) == Error::None);

    MockSource::push_sequence(*xs, 8);
    TEST_CHECK(test::wait_until([&] { return count_lines(s.data_path) == 8; }));
    TEST_CHECK(hub.recorder().writer_error(s.id) == Error::None);

    // Logging stays quiet while the limit is held
    auto& logger = lcr::log::Logger::instance();
    const auto level = logger.level();
    logger.set_level(lcr::log::Level::Fatal);
    {
        test::FileSizeLimit limit(std::filesystem::file_size(s.data_path));
        TEST_CHECK(limit.active());

        MockSource::push_sequence(*xs, 4, 8.0);
        TEST_CHECK(test::wait_until([&] { return hub.recorder().writer_error(s.id) == Error::IoFailure; }));
    }
    logger.set_level(level);

    const auto failed = hub.recording(s.id);
    TEST_CHECK(failed.has_value());
    TEST_CHECK(failed->active);
    TEST_CHECK(!failed->stopped_at.has_value());
    TEST_CHECK(failed->sample_count > 8);
    TEST_CHECK(hub.inlets().ref_count("X") == 1);

    recording::Session stopped;
    TEST_CHECK(hub.stop_recording(s.id, stopped) == Error::None);
    TEST_CHECK(!stopped.active);
    TEST_CHECK(stopped.stopped_at.has_value());
    TEST_CHECK(stopped.sample_count == 8);
    TEST_CHECK(count_lines(s.data_path) == 8);
    TEST_CHECK(hub.inlets().ref_count("X") == 0);

    simdjson::dom::parser parser;
    simdjson::dom::element root_el;
    TEST_CHECK(!parser.load(s.metadata_path.string()).get(root_el));
    double stopped_at = 0.0;
    TEST_CHECK(!root_el["recording"]["stoppedAt"].get(stopped_at));
    TEST_CHECK(stopped_at >= s.started_at);
    std::uint64_t sample_count = 0;
    TEST_CHECK(!root_el["recording"]["sampleCount"].get(sample_count));
    TEST_CHECK(sample_count == 8);

    std::vector<archive::Entry> entries;
    TEST_CHECK(archive::read_tar_lz4(s.archive_path, entries) == Error::None);
    TEST_CHECK(entries.size() == 2);
    TEST_CHECK(entries[0].name == "metadata.json");
    TEST_CHECK(entries[1].name == "samples.ndjson");
    TEST_CHECK(entries[1].content == read_file(s.data_path));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_record_and_stop();
    test_unknown_ids();
    test_downsample_clamp();
    test_labels();
    test_shared_inlet_and_list();
    test_open_failure();
    test_hub_shutdown_finalizes();
    test_write_failure_then_stop();

    std::cout << "\n[RECORDING MANAGER TESTS PASSED]\n";
    return 0;
}
