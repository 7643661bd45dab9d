#pragma once

#include <string>
#include <string_view>

#include "wiredown/core/protocol/showdown/parser/result.hpp"
#include "wiredown/core/protocol/showdown/parser/helpers.hpp"
#include "wiredown/core/protocol/showdown/schema/request.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace wiredown::core::protocol::showdown::parser {

// =============================================================================
// |request| payload parser
// =============================================================================
//
// Any well-formed JSON document is accepted. A payload that is not an object
// (null, array, scalar) yields a snapshot with is_object == false and no
// decoded fields; only malformed JSON is an error.
//
struct request {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::RequestSnapshot& out) {
        out = schema::RequestSnapshot{};
        out.raw = simdjson::minify(root);

        if (!helper::is_object(root)) {
            WD_DEBUG("[PARSER] Non-object request payload: " << out.raw);
            out.is_object = false;
            return Result::Parsed;
        }

        // wait: only the literal `true` suspends the turn
        out.wait = helper::field_is_true(root, "wait");

        helper::parse_int64_optional(root, "rqid", out.rqid);

        // forceSwitch: scalar or per-slot array
        simdjson::dom::element force;
        if (helper::find_field(root, "forceSwitch", force)) {
            if (helper::is_array(force)) {
                for (simdjson::dom::element slot : force.get_array().value_unsafe()) {
                    if (helper::truthy(slot)) {
                        out.force_switch = true;
                        break;
                    }
                }
            }
            else {
                out.force_switch = helper::truthy(force);
            }
        }

        // active: first entry only
        simdjson::dom::array active;
        if (helper::parse_array_optional(root, "active", active) && active.size() > 0) {
            simdjson::dom::element first = active.at(0).value_unsafe();
            schema::ActiveSlot slot;
            parse_active_(first, slot);
            out.active = std::move(slot);
        }

        // side.pokemon
        simdjson::dom::element side;
        simdjson::dom::array pokemon;
        if (helper::find_field(root, "side", side) && helper::parse_array_optional(side, "pokemon", pokemon)) {
            for (simdjson::dom::element p : pokemon) {
                schema::PokemonSlot slot;
                helper::parse_string_optional(p, "ident", slot.ident);
                helper::parse_string_optional(p, "details", slot.details);
                helper::parse_string_or(p, "condition", "", slot.condition);
                slot.active = helper::field_truthy(p, "active");
                out.pokemon.push_back(std::move(slot));
            }
        }

        return Result::Parsed;
    }

    // Parse the text after "|request|". Empty text is an empty object.
    [[nodiscard]]
    static inline Result parse(simdjson::dom::parser& json, std::string_view payload, schema::RequestSnapshot& out) {
        if (payload.empty()) {
            out = schema::RequestSnapshot{};
            return Result::Parsed;
        }
        simdjson::dom::element root;
        auto error = json.parse(payload.data(), payload.size()).get(root);
        if (error) {
            WD_WARN("[PARSER] Invalid request JSON: " << simdjson::error_message(error) << " in payload: " << payload);
            return Result::InvalidJson;
        }
        return parse(root, out);
    }

private:
    static inline void parse_active_(const simdjson::dom::element& e, schema::ActiveSlot& out) {
        helper::parse_string_optional(e, "canTerastallize", out.can_terastallize);
        out.trapped = helper::field_truthy(e, "trapped");
        simdjson::dom::array moves;
        if (!helper::parse_array_optional(e, "moves", moves)) {
            return;
        }
        for (simdjson::dom::element m : moves) {
            schema::MoveSlot move;
            helper::parse_string_optional(m, "id", move.id);
            helper::parse_string_optional(m, "move", move.name);
            helper::parse_int64_optional(m, "pp", move.pp);
            helper::parse_int64_optional(m, "maxpp", move.maxpp);
            helper::parse_string_optional(m, "target", move.target);
            move.disabled = helper::field_truthy(m, "disabled");
            out.moves.push_back(std::move(move));
        }
    }
};

} // namespace wiredown::core::protocol::showdown::parser
