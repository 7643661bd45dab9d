#pragma once

#include <cstdint>
#include <string_view>

#include "wiredown/core/protocol/showdown/schema/request.hpp"
#include "wiredown/core/protocol/showdown/schema/options.hpp"
#include "lcr/optional.hpp"


namespace wiredown::core::protocol::showdown {

// Condition substring marking a fainted pokemon ("0 fnt")
inline constexpr std::string_view FAINTED_MARKER = "fnt";

// -----------------------------------------------------------------------------
// Derive the legal actions of a request snapshot.
//
//   1. no snapshot (or a non-object payload) → default view
//   2. wait                                  → only wait = true
//   3. active[0]: canTerastallize, trapped
//   4. forceSwitch                           → force_switch
//   5. moves that are not disabled
//   6. pokemon that are neither active nor fainted
//
// Filtered entries still consume their slot number: slots always refer to the
// position in the original list.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline schema::OptionsView derive_options(const schema::RequestSnapshot& snapshot) {
    schema::OptionsView view;
    if (!snapshot.is_object) {
        return view;
    }
    if (snapshot.wait) {
        view.wait = true;
        return view;
    }

    if (const schema::ActiveSlot* active = snapshot.active.get_if()) {
        view.can_terastallize = active->can_terastallize;
        view.trapped = active->trapped;

        std::int64_t slot = 0;
        for (const auto& move : active->moves) {
            ++slot;
            if (move.disabled) {
                continue;
            }
            view.moves.push_back(schema::MoveChoice{slot, move.id, move.name, move.pp, move.maxpp, move.target});
        }
    }

    view.force_switch = snapshot.force_switch;

    std::int64_t slot = 0;
    for (const auto& pokemon : snapshot.pokemon) {
        ++slot;
        if (pokemon.active || pokemon.condition.find(FAINTED_MARKER) != std::string::npos) {
            continue;
        }
        view.switches.push_back(schema::SwitchChoice{slot, pokemon.ident, pokemon.details, pokemon.condition});
    }
    return view;
}

[[nodiscard]]
inline schema::OptionsView derive_options(const lcr::optional<schema::RequestSnapshot>& snapshot) {
    if (const schema::RequestSnapshot* s = snapshot.get_if()) {
        return derive_options(*s);
    }
    return schema::OptionsView{};
}

} // namespace wiredown::core::protocol::showdown
