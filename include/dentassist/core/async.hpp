#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dentassist/core/error.hpp"

namespace dentassist {

using boost::asio::awaitable;

/// Shared flag a caller sets when it abandons a request.
/// Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] auto cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Runs the awaitable produced by `op()` and gives up after `timeout`.
///
/// The operation is spawned on the current executor and keeps running if the
/// deadline fires first; its late result is discarded. `op` must therefore
/// own (capture by value) everything it touches. The executor is assumed to
/// be single-threaded, as with one thread calling io_context::run().
template <typename T, typename Op>
auto with_timeout(Op op, std::chrono::milliseconds timeout, std::string what)
    -> awaitable<Result<T>> {
    struct State {
        explicit State(boost::asio::any_io_executor ex) : timer(std::move(ex)) {}
        boost::asio::steady_timer timer;
        std::optional<Result<T>> result;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<State>(executor);
    state->timer.expires_after(timeout);

    boost::asio::co_spawn(executor,
        [state, op = std::move(op)]() mutable -> awaitable<void> {
            auto r = co_await op();
            state->result = std::move(r);
            state->timer.cancel();
        },
        boost::asio::detached);

    // The spawned operation may already have finished if it was dispatched inline.
    if (!state->result.has_value()) {
        boost::system::error_code ec;
        co_await state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->result.has_value()) {
        co_return std::move(*state->result);
    }
    co_return make_fail(make_error(ErrorCode::Timeout, what + " timed out",
        std::to_string(timeout.count()) + "ms"));
}

} // namespace dentassist
