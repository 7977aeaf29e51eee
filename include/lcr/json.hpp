#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>
#include <cmath>
#include <system_error>


namespace lcr {
namespace json {

// Appends `s` to `out` with JSON string escaping (quotes not included).
// Control characters are emitted as \u00XX; bytes >= 0x80 pass through
// untouched (UTF-8 is assumed).
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Allocating convenience for logging / tests
[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    escape(out, s);
    return out;
}

// Appends a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    escape(out, s);
    out += '"';
}

// Fast integer -> string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        // Two's complement safe negation
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// Shortest round-trip representation. JSON has no NaN / Infinity, those
// become null.
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf, ptr);
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}


// ---------------------------------------------------------------------------
// Writer - minimal streaming JSON builder with optional pretty printing.
//
// Keeps track of comma placement and indentation only; it does not validate
// that keys are emitted inside objects. Intended for documents the program
// itself owns (metadata files, API payloads).
// ---------------------------------------------------------------------------
class Writer {
public:
    explicit Writer(std::string& out, int indent = 0) noexcept
        : out_(out)
        , indent_(indent)
    {}

    Writer& begin_object() { value_prefix_(); out_ += '{'; push_(); return *this; }
    Writer& end_object()   { pop_('}'); return *this; }
    Writer& begin_array()  { value_prefix_(); out_ += '['; push_(); return *this; }
    Writer& end_array()    { pop_(']'); return *this; }

    Writer& key(std::string_view k) {
        separator_();
        append_string(out_, k);
        out_ += indent_ > 0 ? ": " : ":";
        after_key_ = true;
        return *this;
    }

    Writer& value(std::string_view v)   { value_prefix_(); append_string(out_, v); return *this; }
    Writer& value(const char* v)        { return value(std::string_view{v}); }
    Writer& value(double v)             { value_prefix_(); append(out_, v); return *this; }
    Writer& value(std::int64_t v)       { value_prefix_(); append(out_, v); return *this; }
    Writer& value(std::uint64_t v)      { value_prefix_(); append(out_, v); return *this; }
    Writer& value(int v)                { return value(static_cast<std::int64_t>(v)); }
    Writer& value(bool v)               { value_prefix_(); append(out_, v); return *this; }
    Writer& null()                      { value_prefix_(); out_ += "null"; return *this; }

    // Emits an already-serialized JSON fragment as a value
    Writer& raw(std::string_view fragment) { value_prefix_(); out_ += fragment; return *this; }

private:
    std::string& out_;
    int indent_;
    int depth_{0};
    bool first_{true};
    bool after_key_{false};

    void newline_() {
        if (indent_ <= 0) return;
        out_ += '\n';
        out_.append(static_cast<std::size_t>(depth_ * indent_), ' ');
    }

    void separator_() {
        if (!first_) out_ += ',';
        if (depth_ > 0) newline_();
        first_ = false;
    }

    void value_prefix_() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (depth_ > 0) separator_();
    }

    void push_() {
        ++depth_;
        first_ = true;
    }

    void pop_(char close) {
        const bool empty = first_;
        --depth_;
        if (!empty) newline_();
        out_ += close;
        first_ = false;
    }
};

} // namespace json
} // namespace lcr
