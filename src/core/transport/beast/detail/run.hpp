#pragma once

#include <chrono>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>


namespace wiredown::core::transport::beast::detail {

using clock = std::chrono::steady_clock;

// -----------------------------------------------------------------------------
// Drive `ioc` on the calling thread until `done` becomes true or `deadline`
// passes. Returns the final value of `done`.
//
// Outstanding operations are NOT cancelled on timeout: a pending read simply
// stays queued on the io_context and completes during a later run.
// -----------------------------------------------------------------------------
inline bool run_until(boost::asio::io_context& ioc, const bool& done, clock::time_point deadline) {
    ioc.restart();
    while (!done) {
        if (ioc.run_one_until(deadline) == 0) {
            // Either the deadline passed or the context ran out of work
            break;
        }
    }
    return done;
}

// -----------------------------------------------------------------------------
// Run one asynchronous operation to completion under a deadline.
//
// `initiate` receives the completion handler and must start exactly one
// operation with it. On timeout `cancel` is invoked and the context is drained
// until the cancelled operation has completed, so the handler never outlives
// this frame.
// -----------------------------------------------------------------------------
template <class Initiate, class Cancel>
inline boost::system::error_code run_op(boost::asio::io_context& ioc,
                                        clock::time_point deadline,
                                        Initiate&& initiate,
                                        Cancel&& cancel,
                                        bool& timed_out) {
    bool done = false;
    boost::system::error_code result;
    std::forward<Initiate>(initiate)([&done, &result](boost::system::error_code ec, auto&&...) {
        result = ec;
        done = true;
    });
    timed_out = !run_until(ioc, done, deadline);
    if (timed_out) {
        std::forward<Cancel>(cancel)();
        ioc.restart();
        while (!done && ioc.run_one() > 0) {}
    }
    return result;
}

} // namespace wiredown::core::transport::beast::detail
