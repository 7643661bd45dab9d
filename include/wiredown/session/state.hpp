#pragma once

#include <string>
#include <string_view>
#include <map>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <cstdint>
#include <cstdlib>

#include "lcr/optional.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace wiredown::session {

inline constexpr std::string_view DEFAULT_STATE_PATH = "ps_client_state.json";

// "~" and "~/..." resolve against $HOME; anything else is used as given
[[nodiscard]]
inline std::filesystem::path expand_user(std::string_view path) {
    if (path.empty() || path.front() != '~' || (path.size() > 1 && path[1] != '/')) {
        return std::filesystem::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::path(path);
    }
    return std::filesystem::path(std::string(home) + std::string(path.substr(1)));
}

/*
===============================================================================
 StateDocument
===============================================================================

The persisted state file: one flat JSON object shared by every invocation
(and possibly by other tools writing their own keys).

Values are kept as serialized JSON text, so keys this client does not know
about, nested objects included, are written back exactly as they were read.

  load()   absent, unreadable, malformed or non-object file → empty document
  save()   sorted keys, two-space indent, written to "<path>.tmp" and renamed
           over the target; parent directories are created

Writers follow read-modify-write: load, set the keys they own, save.
===============================================================================
*/
class StateDocument {
public:
    using Values = std::map<std::string, std::string, std::less<>>;   // key → JSON text

    StateDocument() = default;

    [[nodiscard]]
    static inline StateDocument load(const std::filesystem::path& path) {
        StateDocument doc;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            WD_DEBUG("[STATE] No state file at " << path.string());
            return doc;
        }
        simdjson::padded_string text;
        if (simdjson::padded_string::load(path.string()).get(text)) {
            WD_WARN("[STATE] Cannot read state file " << path.string() << ", starting empty");
            return doc;
        }
        simdjson::dom::parser parser;
        simdjson::dom::object root;
        if (parser.parse(text).get(root)) {
            WD_WARN("[STATE] State file " << path.string() << " is not a JSON object, starting empty");
            return doc;
        }
        for (auto field : root) {
            doc.values_[std::string(field.key)] = simdjson::minify(field.value);
        }
        WD_DEBUG("[STATE] Loaded " << doc.values_.size() << " keys from " << path.string());
        return doc;
    }

    // Accessors -----------------------------------------------------------------

    [[nodiscard]]
    inline bool has(std::string_view key) const {
        return values_.find(key) != values_.end();
    }

    [[nodiscard]]
    inline lcr::optional<std::string> raw(std::string_view key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {};
        }
        return it->second;
    }

    // Value of a string key. Missing keys and non-string values are unset.
    [[nodiscard]]
    inline lcr::optional<std::string> get_string(std::string_view key) const {
        lcr::optional<std::string> out;
        simdjson::dom::parser parser;
        simdjson::dom::element value;
        std::string_view sv;
        if (parse_(parser, key, value) && !value.get(sv)) {
            out = std::string(sv);
        }
        return out;
    }

    // Value of an integer key. Missing keys and non-integer values are unset.
    [[nodiscard]]
    inline lcr::optional<std::int64_t> get_int(std::string_view key) const {
        lcr::optional<std::int64_t> out;
        simdjson::dom::parser parser;
        simdjson::dom::element value;
        std::int64_t v = 0;
        if (parse_(parser, key, value) && !value.get(v)) {
            out = v;
        }
        return out;
    }

    [[nodiscard]]
    inline const Values& values() const noexcept {
        return values_;
    }

    // Mutators ------------------------------------------------------------------

    // `json` must be one serialized JSON value
    inline void set_raw(std::string_view key, std::string json) {
        values_[std::string(key)] = std::move(json);
    }

    inline void set(std::string_view key, std::string_view value) {
        lcr::json::Writer w;
        w.value(value);
        set_raw(key, w.release());
    }

    inline void set(std::string_view key, const char* value) {
        set(key, std::string_view{value});
    }

    inline void set(std::string_view key, std::int64_t value) {
        lcr::json::Writer w;
        w.value(value);
        set_raw(key, w.release());
    }

    inline void set(std::string_view key, double value) {
        lcr::json::Writer w;
        w.value(value);
        set_raw(key, w.release());
    }

    inline void set(std::string_view key, bool value) {
        set_raw(key, value ? "true" : "false");
    }

    inline void set_null(std::string_view key) {
        set_raw(key, "null");
    }

    template <typename T>
    inline void set(std::string_view key, const lcr::optional<T>& value) {
        if (!value.has()) {
            set_null(key);
            return;
        }
        set(key, value.value());
    }

    // Serialization -------------------------------------------------------------

    [[nodiscard]]
    inline std::string to_json() const {
        lcr::json::Writer w(2);
        w.begin_object();
        for (const auto& [key, json] : values_) {
            w.key(key).raw(json);
        }
        w.end_object();
        return w.release();
    }

    // Returns false (with `error` set) when the file could not be written
    [[nodiscard]]
    inline bool save(const std::filesystem::path& path, std::string& error) const {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                error = "Cannot create directory " + path.parent_path().string() + ": " + ec.message();
                WD_ERROR("[STATE] " << error);
                return false;
            }
        }
        std::filesystem::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                error = "Cannot open " + tmp.string() + " for writing";
                WD_ERROR("[STATE] " << error);
                return false;
            }
            file << to_json();
            file.flush();
            if (!file) {
                error = "Cannot write " + tmp.string();
                WD_ERROR("[STATE] " << error);
                return false;
            }
        }
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            error = "Cannot replace " + path.string() + ": " + ec.message();
            WD_ERROR("[STATE] " << error);
            std::filesystem::remove(tmp, ec);
            return false;
        }
        WD_DEBUG("[STATE] Saved " << values_.size() << " keys to " << path.string());
        return true;
    }

private:
    Values values_;

    [[nodiscard]]
    inline bool parse_(simdjson::dom::parser& parser, std::string_view key, simdjson::dom::element& out) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return false;
        }
        return !parser.parse(it->second).get(out);
    }
};

} // namespace wiredown::session
