#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dentassist/chat/session.hpp"
#include "dentassist/chat/store.hpp"
#include "dentassist/core/error.hpp"

namespace dentassist::chat {

using boost::asio::awaitable;

/// Conversation identity and history.
///
/// Sessions are independent. Appends to one session are serialised and
/// stamped with non-decreasing timestamps, even if the wall clock steps
/// back or two writers race.
class SessionManager {
public:
    SessionManager(std::unique_ptr<ChatStore> store, size_t history_limit = 50);

    auto create_session(std::string_view user_id) -> awaitable<Result<ChatSession>>;

    /// Creates the session under the caller's id if it does not exist yet.
    /// An idle session is made active again; a closed one is a SessionError.
    auto open_session(std::string_view session_id, std::string_view user_id)
        -> awaitable<Result<ChatSession>>;

    auto get_session(std::string_view id) -> awaitable<Result<ChatSession>>;

    auto append_message(std::string_view session_id, MessageInput input)
        -> awaitable<Result<ChatMessage>>;

    /// The last `limit` messages in order; 0 means the configured limit.
    auto get_history(std::string_view session_id, size_t limit = 0)
        -> awaitable<Result<std::vector<ChatMessage>>>;

    auto end_session(std::string_view id) -> awaitable<Result<void>>;

    /// Marks sessions idle after `timeout` without activity and forgets
    /// their in-memory timestamp floors.
    auto expire_idle(std::chrono::seconds timeout) -> awaitable<Result<size_t>>;

    auto session_stats() -> awaitable<Result<SessionStats>>;

    [[nodiscard]] auto history_limit() const noexcept -> size_t { return history_limit_; }

    /// Sessions whose last timestamp is cached in memory.
    [[nodiscard]] auto tracked_sessions() const -> size_t;

private:
    /// Next timestamp for `session_id`: max(now, last stamped).
    auto next_timestamp(const std::string& session_id, std::optional<Timestamp> floor)
        -> Timestamp;

    std::unique_ptr<ChatStore> store_;
    size_t history_limit_;

    /// Orders timestamp assignment only; the store serialises the writes.
    mutable std::mutex clock_mutex_;
    // Cache of the newest stamp per session. A miss falls back to the store.
    std::unordered_map<std::string, Timestamp> last_stamp_;
};

} // namespace dentassist::chat
