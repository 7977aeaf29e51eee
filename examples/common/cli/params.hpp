#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace telemux::examples::cli::relay_demo {

struct Params {
    std::vector<std::string> streams = {"SimAccel"};
    int relay_downsample             = 10;
    std::string record_stream        = "SimEEG";
    std::string record_label         = {};
    int record_downsample            = 1;
    int record_seconds               = 3;
    int duration_seconds             = 5;
    std::string root                 = "recordings";
    bool no_record                   = false;
    std::string log_level            = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Relayed streams   : ";
        for (const auto& s : streams) {
            os << s << " ";
        }
        os << "\n  Relay downsample  : " << relay_downsample;
        if (no_record) {
            os << "\n  Recording         : disabled";
        } else {
            os << "\n  Recorded stream   : " << record_stream
               << "\n  Recording label   : " << (record_label.empty() ? "(none)" : record_label)
               << "\n  Record downsample : " << record_downsample
               << "\n  Record duration   : " << record_seconds << " s"
               << "\n  Recordings root   : " << root;
        }
        os << "\n  Run duration      : ";
        if (duration_seconds > 0) os << duration_seconds << " s";
        else                      os << "until Ctrl+C";
        os << "\n  Log Level         : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-s,--stream", params.streams, "Simulated stream(s) to relay to the console (repeatable)")->check(stream_name_validator)->default_val(params.streams);
    app.add_option("-d,--downsample", params.relay_downsample, "Forward every N-th sample to the console")->check(downsample_validator)->default_val(params.relay_downsample);
    app.add_option("--record", params.record_stream, "Simulated stream to record")->check(stream_name_validator)->default_val(params.record_stream);
    app.add_option("--label", params.record_label, "Recording label (names the recording directory)");
    app.add_option("--record-downsample", params.record_downsample, "Record every N-th sample")->check(downsample_validator)->default_val(params.record_downsample);
    app.add_option("--record-seconds", params.record_seconds, "Stop the recording after N seconds")->check(CLI::PositiveNumber)->default_val(params.record_seconds);
    app.add_option("--root", params.root, "Recordings root directory")->default_val(params.root);
    app.add_flag("--no-record", params.no_record, "Relay only, do not record");
    app.add_option("-t,--duration", params.duration_seconds, "Run for N seconds (0 = until Ctrl+C)")->check(CLI::NonNegativeNumber)->default_val(params.duration_seconds);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Streams come from an in-process simulated source.\n"
        "Relayed samples are printed as JSON frames; the recording is\n"
        "finalized into a .tar.lz4 archive when it stops."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace telemux::examples::cli::relay_demo
