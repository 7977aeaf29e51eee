#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace telemux::core::stream {

// One channel value: numeric formats widen to double or int64
using Value = std::variant<double, std::int64_t, std::string>;

// ---------------------------------------------------------------------------
// Sample - one multi-channel reading with its source timestamp (seconds).
// Immutable once produced; shared by every subscriber queue it is fanned out
// to.
// ---------------------------------------------------------------------------
struct Sample {
    double             timestamp{0.0};
    std::vector<Value> values;
};

using SamplePtr = std::shared_ptr<const Sample>;

[[nodiscard]]
inline SamplePtr make_sample(double timestamp, std::vector<Value> values) {
    return std::make_shared<const Sample>(Sample{timestamp, std::move(values)});
}

// Appends {"t": <timestamp>, "d": [<values>...]} (no trailing newline).
// Same record shape for relay frames and recorded lines.
void append_json(std::string& out, const Sample& s);

[[nodiscard]]
std::string to_json(const Sample& s);

} // namespace telemux::core::stream
