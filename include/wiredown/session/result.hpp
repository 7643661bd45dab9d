#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "wiredown/error.hpp"
#include "wiredown/core/protocol/showdown/schema/request.hpp"
#include "wiredown/core/protocol/showdown/schema/options.hpp"
#include "lcr/optional.hpp"
#include "lcr/json.hpp"


namespace wiredown::session {

namespace schema = core::protocol::showdown::schema;

// The snapshot is re-emitted as received (minified), or null
inline void write_request(lcr::json::Writer& w, const lcr::optional<schema::RequestSnapshot>& request) {
    if (const schema::RequestSnapshot* r = request.get_if()) {
        w.raw(r->raw);
    }
    else {
        w.null();
    }
}

// Request id carried by a snapshot, if any
[[nodiscard]]
inline lcr::optional<std::int64_t> rqid_of(const lcr::optional<schema::RequestSnapshot>& request) {
    if (const schema::RequestSnapshot* r = request.get_if()) {
        return r->rqid;
    }
    return {};
}


struct StartResult {
    std::string battle_id;
    lcr::optional<std::string> title;
    lcr::optional<std::int64_t> turn;
    lcr::optional<std::int64_t> rqid;
    lcr::optional<std::string> error;
    lcr::optional<schema::RequestSnapshot> request;
    schema::OptionsView options;
    std::string state_path;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("battle_id").value(battle_id);
        w.key("title").value(title);
        w.key("turn").value(turn);
        w.key("rqid").value(rqid);
        w.key("error").value(error);
        w.key("request");
        write_request(w, request);
        w.key("options");
        options.write_json(w);
        w.key("state_path").value(state_path);
        w.end_object();
    }
};


struct ObserveResult {
    std::string battle_id;
    lcr::optional<std::int64_t> turn;
    lcr::optional<std::string> error;
    lcr::optional<std::int64_t> rqid;
    lcr::optional<schema::RequestSnapshot> request;
    schema::OptionsView options;
    std::string state_path;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("battle_id").value(battle_id);
        w.key("turn").value(turn);
        w.key("error").value(error);
        w.key("rqid").value(rqid);
        w.key("request");
        write_request(w, request);
        w.key("options");
        options.write_json(w);
        w.key("state_path").value(state_path);
        w.end_object();
    }
};


struct ActResult {
    std::string battle_id;
    std::string sent;                         // normalized "/choose ..." command
    std::int64_t rqid{0};                     // request id the action was sent against
    lcr::optional<std::string> error;
    lcr::optional<std::int64_t> turn;
    lcr::optional<schema::RequestSnapshot> request;
    schema::OptionsView options;
    std::vector<std::string> events;
    bool finished{false};
    lcr::optional<std::string> winner;
    bool tie{false};
    std::string state_path;

    inline void write_json(lcr::json::Writer& w) const {
        w.begin_object();
        w.key("battle_id").value(battle_id);
        w.key("sent").value(sent);
        w.key("rqid").value(rqid);
        w.key("error").value(error);
        w.key("turn").value(turn);
        w.key("request");
        write_request(w, request);
        w.key("options");
        options.write_json(w);
        w.key("events").begin_array();
        for (const auto& e : events) {
            w.value(e);
        }
        w.end_array();
        w.key("finished").value(finished);
        w.key("winner").value(winner);
        w.key("tie").value(tie);
        w.key("state_path").value(state_path);
        w.end_object();
    }
};


template <typename R>
[[nodiscard]]
inline std::string to_json(const R& result) {
    lcr::json::Writer w;
    result.write_json(w);
    return w.release();
}

// Failure record printed instead of a result
[[nodiscard]]
inline std::string to_json(const Error& error) {
    lcr::json::Writer w;
    w.begin_object();
    w.key("error").value(error.message);
    w.end_object();
    return w.release();
}

} // namespace wiredown::session
