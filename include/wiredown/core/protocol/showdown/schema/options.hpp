#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "lcr/optional.hpp"
#include "lcr/json.hpp"


namespace wiredown::core {
namespace protocol {
namespace showdown {
namespace schema {

// Legal move. `slot` is the 1-based position in the request's move list.
struct MoveChoice {
    std::int64_t slot{0};
    lcr::optional<std::string> id;
    lcr::optional<std::string> name;
    lcr::optional<std::int64_t> pp;
    lcr::optional<std::int64_t> maxpp;
    lcr::optional<std::string> target;

    bool operator==(const MoveChoice&) const = default;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("slot").value(slot);
        w.key("id").value(id);
        w.key("name").value(name);
        w.key("pp").value(pp);
        w.key("maxpp").value(maxpp);
        w.key("target").value(target);
        w.end_object();
    }
};

// Legal switch target. `slot` is the 1-based position in side.pokemon.
struct SwitchChoice {
    std::int64_t slot{0};
    lcr::optional<std::string> ident;
    lcr::optional<std::string> details;
    std::string condition;

    bool operator==(const SwitchChoice&) const = default;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("slot").value(slot);
        w.key("ident").value(ident);
        w.key("details").value(details);
        w.key("condition").value(condition);
        w.end_object();
    }
};

// Legal actions for the current request (always derived, never stored)
struct OptionsView {
    std::vector<MoveChoice> moves;
    std::vector<SwitchChoice> switches;
    lcr::optional<std::string> can_terastallize;
    bool trapped{false};
    bool force_switch{false};
    bool wait{false};

    bool operator==(const OptionsView&) const = default;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("moves").begin_array();
        for (const auto& m : moves) {
            m.write_json(w);
        }
        w.end_array();
        w.key("switches").begin_array();
        for (const auto& s : switches) {
            s.write_json(w);
        }
        w.end_array();
        w.key("can_terastallize").value(can_terastallize);
        w.key("trapped").value(trapped);
        w.key("force_switch").value(force_switch);
        w.key("wait").value(wait);
        w.end_object();
    }

    [[nodiscard]]
    inline std::string to_json() const {
        lcr::json::Writer w;
        write_json(w);
        return w.release();
    }
};

} // namespace schema
} // namespace showdown
} // namespace protocol
} // namespace wiredown::core
