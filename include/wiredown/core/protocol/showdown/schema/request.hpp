#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "lcr/optional.hpp"


namespace wiredown::core {
namespace protocol {
namespace showdown {
namespace schema {

/*
===============================================================================
 Request snapshot (|request| payload)
===============================================================================

Decoded view of the JSON object the server sends with every |request| line.
Every field is optional on the wire; presence is tracked explicitly and loose
wire shapes are normalized here:

  • wait          true only for the literal JSON `true`
  • active        only the first entry is kept
  • forceSwitch   scalar or array, folded into one boolean
  • condition     missing → ""

The minified original JSON is kept in `raw` so the snapshot can be persisted
and re-emitted without losing fields this client does not model.
===============================================================================
*/

struct MoveSlot {
    lcr::optional<std::string> id;
    lcr::optional<std::string> name;        // wire key: "move"
    lcr::optional<std::int64_t> pp;
    lcr::optional<std::int64_t> maxpp;
    lcr::optional<std::string> target;
    bool disabled{false};

    bool operator==(const MoveSlot&) const = default;
};

struct ActiveSlot {
    lcr::optional<std::string> can_terastallize;
    bool trapped{false};
    std::vector<MoveSlot> moves;

    bool operator==(const ActiveSlot&) const = default;
};

struct PokemonSlot {
    lcr::optional<std::string> ident;
    lcr::optional<std::string> details;
    std::string condition;
    bool active{false};

    bool operator==(const PokemonSlot&) const = default;
};

struct RequestSnapshot {
    bool is_object{true};                   // false for null / non-object payloads
    bool wait{false};
    lcr::optional<ActiveSlot> active;
    bool force_switch{false};
    std::vector<PokemonSlot> pokemon;       // side.pokemon
    lcr::optional<std::int64_t> rqid;

    std::string raw{"{}"};                  // minified payload

    bool operator==(const RequestSnapshot&) const = default;
};

} // namespace schema
} // namespace showdown
} // namespace protocol
} // namespace wiredown::core
