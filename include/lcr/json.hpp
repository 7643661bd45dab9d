#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <cmath>

#include "lcr/optional.hpp"


namespace lcr {
namespace json {

// ---------------------------------------------------------------------------
// Escaping (RFC 8259): quotes, backslash and control characters.
// Bytes >= 0x80 are passed through untouched (UTF-8 is valid JSON text).
// ---------------------------------------------------------------------------
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (u < 0x20) {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Fast integer → string formatter
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


// ===========================================================================
// Writer
// ===========================================================================
//
// Streaming JSON builder with automatic comma placement.
//
//   Writer w;
//   w.begin_object();
//   w.key("slot").value(std::int64_t{1});
//   w.end_object();
//   w.str() == R"({"slot":1})"
//
// raw() splices an already-serialized JSON value (e.g. a payload kept
// verbatim from the wire) without re-encoding it.
//
// With indent > 0, only members of the outermost container are broken onto
// separate lines; nested containers stay compact.
//
class Writer {
public:
    explicit Writer(int indent = 0) : indent_(indent) {
        out_.reserve(256);
    }

    inline Writer& begin_object() { open_('{'); return *this; }
    inline Writer& end_object()   { close_('}'); return *this; }
    inline Writer& begin_array()  { open_('['); return *this; }
    inline Writer& end_array()    { close_(']'); return *this; }

    inline Writer& key(std::string_view k) {
        separate_();
        out_ += '"';
        escape(out_, k);
        out_ += (indent_ > 0 && depth_() == 1) ? "\": " : "\":";
        after_key_ = true;
        return *this;
    }

    inline Writer& value(std::string_view s) {
        separate_();
        out_ += '"';
        escape(out_, s);
        out_ += '"';
        return *this;
    }

    inline Writer& value(const char* s) { return value(std::string_view{s}); }
    inline Writer& value(const std::string& s) { return value(std::string_view{s}); }

    inline Writer& value(bool b) {
        separate_();
        out_ += b ? "true" : "false";
        return *this;
    }

    inline Writer& value(std::int64_t v) {
        separate_();
        append(out_, v);
        return *this;
    }

    inline Writer& value(double v) {
        separate_();
        if (!std::isfinite(v)) {
            out_ += "null";
            return *this;
        }
        char buf[64];
        int n = std::snprintf(buf, sizeof(buf), "%.17g", v);
        out_.append(buf, static_cast<std::size_t>(n));
        return *this;
    }

    template <typename T>
    inline Writer& value(const lcr::optional<T>& opt) {
        if (!opt.has()) {
            return null();
        }
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            return value(static_cast<std::int64_t>(opt.value()));
        } else {
            return value(opt.value());
        }
    }

    inline Writer& null() {
        separate_();
        out_ += "null";
        return *this;
    }

    inline Writer& raw(std::string_view json) {
        separate_();
        out_ += json;
        return *this;
    }

    [[nodiscard]] inline const std::string& str() const noexcept { return out_; }

    [[nodiscard]] inline std::string release() noexcept { return std::move(out_); }

private:
    // One entry per open container: true until its first member is written
    std::vector<bool> first_;
    std::string out_;
    int indent_;
    bool after_key_{false};

    [[nodiscard]] inline std::size_t depth_() const noexcept { return first_.size(); }

    inline void newline_(std::size_t depth) {
        out_ += '\n';
        out_.append(depth * static_cast<std::size_t>(indent_), ' ');
    }

    inline void separate_() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (first_.empty()) {
            return;
        }
        if (!first_.back()) {
            out_ += ',';
        }
        first_.back() = false;
        if (indent_ > 0 && depth_() == 1) {
            newline_(1);
        }
    }

    inline void open_(char c) {
        separate_();
        out_ += c;
        first_.push_back(true);
    }

    inline void close_(char c) {
        const bool empty = first_.back();
        first_.pop_back();
        if (indent_ > 0 && first_.empty() && !empty) {
            newline_(0);
        }
        out_ += c;
    }
};

} // namespace json
} // namespace lcr
