#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#include "dentassist/chat/session.hpp"
#include "dentassist/core/error.hpp"

namespace dentassist::chat {

using boost::asio::awaitable;

class ChatStore {
public:
    virtual ~ChatStore() = default;

    virtual auto create(const ChatSession& session) -> awaitable<Result<void>> = 0;
    virtual auto get(std::string_view id) -> awaitable<Result<ChatSession>> = 0;
    virtual auto update(const ChatSession& session) -> awaitable<Result<void>> = 0;

    /// Inserts the message and bumps the session's message_count and
    /// last_active in one transaction. Returns the message with its id.
    virtual auto append(ChatMessage message) -> awaitable<Result<ChatMessage>> = 0;

    /// The most recent `limit` messages in chronological order (0 = all).
    virtual auto messages(std::string_view session_id, size_t limit)
        -> awaitable<Result<std::vector<ChatMessage>>> = 0;

    virtual auto latest_message_time(std::string_view session_id)
        -> awaitable<Result<std::optional<Timestamp>>> = 0;

    /// Marks active sessions last used before `cutoff` as idle.
    virtual auto mark_idle(Timestamp cutoff) -> awaitable<Result<size_t>> = 0;

    virtual auto stats() -> awaitable<Result<SessionStats>> = 0;
};

/// Sessions and messages in SQLite (`chat_sessions`, `chat_messages`).
/// Sessions are never deleted.
class SqliteChatStore : public ChatStore {
public:
    explicit SqliteChatStore(const std::string& db_path);
    ~SqliteChatStore() override;

    SqliteChatStore(const SqliteChatStore&) = delete;
    SqliteChatStore& operator=(const SqliteChatStore&) = delete;

    auto create(const ChatSession& session) -> awaitable<Result<void>> override;
    auto get(std::string_view id) -> awaitable<Result<ChatSession>> override;
    auto update(const ChatSession& session) -> awaitable<Result<void>> override;
    auto append(ChatMessage message) -> awaitable<Result<ChatMessage>> override;
    auto messages(std::string_view session_id, size_t limit)
        -> awaitable<Result<std::vector<ChatMessage>>> override;
    auto latest_message_time(std::string_view session_id)
        -> awaitable<Result<std::optional<Timestamp>>> override;
    auto mark_idle(Timestamp cutoff) -> awaitable<Result<size_t>> override;
    auto stats() -> awaitable<Result<SessionStats>> override;

private:
    void init_schema();

    std::unique_ptr<SQLite::Database> db_;
    std::mutex mutex_;
};

} // namespace dentassist::chat
