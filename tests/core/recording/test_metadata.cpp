/*
===============================================================================
 recording metadata - Unit Tests
===============================================================================

Scope:
------
metadata.json documents written at recording start and stop.

Covered Requirements:
---------------------
D1. Initial document: recording, stream and backend blocks
D2. Final document keeps every foreign member and key order, adds the stop
    fields to the recording block exactly once (also when merged twice)
D3. Unparsable input yields a document holding only the recording block
D4. write_final_metadata falls back to the initial document when the file
    is gone

===============================================================================
*/

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "simdjson.h"

#include "telemux/core/recording/metadata.hpp"
#include "telemux/core/recording/data_file.hpp"
#include "common/test_check.hpp"
#include "common/mock_source.hpp"
#include "common/temp_dir.hpp"

using namespace telemux;
using namespace telemux::core;
using namespace telemux::core::recording;


static Session make_session() {
    Session s;
    s.id = "0123456789ab";
    s.stream_uid = "X";
    s.stream_name = "Xstream";
    s.started_at = 1704164645.25;
    s.downsample = 2;
    return s;
}

static std::size_t count_of(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}


void test_initial_document() {
    std::cout << "[TEST] Group D1: initial document\n";

    const Session s = make_session();
    const BackendInfo backend = collect_backend_info("mock-source 1.0");
    TEST_CHECK(!backend.telemux.empty());
    TEST_CHECK(backend.cplusplus >= 202002L);

    const std::string doc = make_initial_metadata(s, test::make_descriptor("X", "Xstream", 3), backend);
    TEST_CHECK(!doc.empty() && doc.back() == '\n');

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(doc).get(root));

    std::string_view iso;
    TEST_CHECK(!root["recording"]["startedAtIso"].get(iso));
    TEST_CHECK(iso == "2024-01-02T03:04:05.250000Z");

    std::uint64_t ds = 0;
    TEST_CHECK(!root["recording"]["downsample"].get(ds));
    TEST_CHECK(ds == 2);

    simdjson::dom::element label;
    TEST_CHECK(!root["recording"]["label"].get(label));
    TEST_CHECK(label.is_null());

    std::int64_t channels = 0;
    TEST_CHECK(!root["stream"]["channelCount"].get(channels));
    TEST_CHECK(channels == 3);

    std::string_view discovery;
    TEST_CHECK(!root["backend"]["discovery"].get(discovery));
    TEST_CHECK(discovery == "mock-source 1.0");

    std::cout << "[TEST] OK\n";
}

void test_final_merge() {
    std::cout << "[TEST] Group D2: final merge\n";

    Session s = make_session();
    s.stopped_at = s.started_at + 12.5;
    s.sample_count = 1234;

    const std::string existing =
        "{\"custom\":{\"nested\":[1,2.5,\"x\",true,null]},"
        "\"recording\":{\"id\":\"0123456789ab\",\"note\":\"kept\",\"sampleCount\":7},"
        "\"tail\":-3}";

    const std::string merged = make_final_metadata(existing, s);

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.parse(merged).get(root));

    // Foreign members survive in their original order
    simdjson::dom::object obj;
    TEST_CHECK(!root.get(obj));
    std::vector<std::string> keys;
    for (auto field : obj) keys.emplace_back(field.key);
    TEST_CHECK(keys.size() == 3);
    TEST_CHECK(keys[0] == "custom");
    TEST_CHECK(keys[1] == "recording");
    TEST_CHECK(keys[2] == "tail");

    simdjson::dom::array nested;
    TEST_CHECK(!root["custom"]["nested"].get(nested));
    TEST_CHECK(nested.size() == 5);
    std::int64_t tail = 0;
    TEST_CHECK(!root["tail"].get(tail));
    TEST_CHECK(tail == -3);

    std::string_view note;
    TEST_CHECK(!root["recording"]["note"].get(note));
    TEST_CHECK(note == "kept");

    // Stale stop fields replaced
    std::uint64_t count = 0;
    TEST_CHECK(!root["recording"]["sampleCount"].get(count));
    TEST_CHECK(count == 1234);
    double duration = 0;
    TEST_CHECK(!root["recording"]["durationSeconds"].get(duration));
    TEST_CHECK(duration == 12.5);

    // Merging again is stable
    const std::string twice = make_final_metadata(merged, s);
    TEST_CHECK(twice == merged);
    TEST_CHECK(count_of(twice, "\"sampleCount\"") == 1);

    std::cout << "[TEST] OK\n";
}

void test_unparsable_input() {
    std::cout << "[TEST] Group D3: unparsable input\n";

    Session s = make_session();
    s.stopped_at = s.started_at + 1.0;

    for (const char* bad : {"", "not json", "[1,2,3]", "{\"truncated\":"}) {
        const std::string doc = make_final_metadata(bad, s);
        simdjson::dom::parser parser;
        simdjson::dom::element root;
        TEST_CHECK(!parser.parse(doc).get(root));
        simdjson::dom::object obj;
        TEST_CHECK(!root.get(obj));
        TEST_CHECK(obj.size() == 1);
        std::string_view iso;
        TEST_CHECK(!root["recording"]["stoppedAtIso"].get(iso));
        TEST_CHECK(iso == "2024-01-02T03:04:06.250000Z");
    }

    std::cout << "[TEST] OK\n";
}

void test_write_final_fallback() {
    std::cout << "[TEST] Group D4: reload fallback\n";

    test::TempDir dir("tm_meta");
    Session s = make_session();
    s.metadata_path = dir.path() / "metadata.json";
    s.stopped_at = s.started_at + 2.0;
    s.sample_count = 5;

    const std::string initial = make_initial_metadata(s, test::make_descriptor("X", "Xstream"),
                                                      collect_backend_info("mock-source 1.0"));

    // No file on disk: the initial document is used
    TEST_CHECK(!std::filesystem::exists(s.metadata_path));
    TEST_CHECK(write_final_metadata(s, initial) == Error::None);
    TEST_CHECK(std::filesystem::exists(s.metadata_path));
    TEST_CHECK(!std::filesystem::exists(dir.path() / "metadata.json.tmp"));

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    TEST_CHECK(!parser.load(s.metadata_path.string()).get(root));
    std::string_view uid;
    TEST_CHECK(!root["stream"]["uid"].get(uid));
    TEST_CHECK(uid == "X");
    std::uint64_t count = 0;
    TEST_CHECK(!root["recording"]["sampleCount"].get(count));
    TEST_CHECK(count == 5);

    // Unwritable target
    Session broken = s;
    broken.metadata_path = dir.path() / "missing_dir" / "metadata.json";
    TEST_CHECK(write_final_metadata(broken, initial) == Error::IoFailure);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_initial_document();
    test_final_merge();
    test_unparsable_input();
    test_write_final_fallback();

    std::cout << "\n[RECORDING METADATA TESTS PASSED]\n";
    return 0;
}
