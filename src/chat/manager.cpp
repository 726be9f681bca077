#include "dentassist/chat/manager.hpp"

#include <algorithm>

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::chat {

namespace {

constexpr std::string_view kAnonymousUser = "anonymous";

auto make_session(std::string id, std::string_view user_id) -> ChatSession {
    auto now = from_epoch_ms(to_epoch_ms(Clock::now()));
    ChatSession s;
    s.id = std::move(id);
    s.user_id = user_id.empty() ? std::string(kAnonymousUser) : std::string(user_id);
    s.state = SessionState::Active;
    s.started_at = now;
    s.last_active = now;
    return s;
}

} // anonymous namespace

SessionManager::SessionManager(std::unique_ptr<ChatStore> store, size_t history_limit)
    : store_(std::move(store)), history_limit_(history_limit) {
    LOG_INFO("Chat session manager initialized (history limit {})", history_limit_);
}

auto SessionManager::create_session(std::string_view user_id)
    -> awaitable<Result<ChatSession>> {
    auto session = make_session(utils::generate_uuid(), user_id);
    auto created = co_await store_->create(session);
    if (!created) {
        LOG_ERROR("Failed to create session for user {}: {}", session.user_id,
                  created.error().what());
        co_return make_fail(created.error());
    }
    LOG_INFO("Created chat session {} for user {}", session.id, session.user_id);
    co_return session;
}

auto SessionManager::open_session(std::string_view session_id, std::string_view user_id)
    -> awaitable<Result<ChatSession>> {
    if (utils::trim(session_id).empty()) {
        co_return co_await create_session(user_id);
    }

    auto existing = co_await store_->get(session_id);
    if (!existing) {
        if (existing.error().code() != ErrorCode::NotFound) {
            co_return make_fail(existing.error());
        }
        auto session = make_session(std::string(session_id), user_id);
        auto created = co_await store_->create(session);
        if (created) {
            LOG_INFO("Opened new chat session {}", session.id);
            co_return session;
        }
        if (created.error().code() != ErrorCode::AlreadyExists) {
            co_return make_fail(created.error());
        }
        // Lost a race with another opener; use theirs.
        existing = co_await store_->get(session_id);
        if (!existing) {
            co_return make_fail(existing.error());
        }
    }

    auto session = std::move(*existing);
    if (session.state == SessionState::Closed) {
        co_return make_fail(make_error(ErrorCode::SessionError,
            "Session has ended", session.id));
    }
    if (session.state == SessionState::Idle) {
        session.state = SessionState::Active;
        session.last_active = Clock::now();
        auto updated = co_await store_->update(session);
        if (!updated) {
            co_return make_fail(updated.error());
        }
        LOG_DEBUG("Session {} resumed from idle", session.id);
    }
    co_return session;
}

auto SessionManager::get_session(std::string_view id) -> awaitable<Result<ChatSession>> {
    auto result = co_await store_->get(id);
    if (!result) {
        LOG_DEBUG("Session {} not found", id);
    }
    co_return result;
}

auto SessionManager::next_timestamp(const std::string& session_id,
                                    std::optional<Timestamp> floor) -> Timestamp {
    // Millisecond precision matches what the store keeps.
    auto now = from_epoch_ms(to_epoch_ms(Clock::now()));

    std::lock_guard lock(clock_mutex_);
    auto& last = last_stamp_[session_id];
    if (floor && *floor > last) last = *floor;
    if (now < last) now = last;
    last = now;
    return now;
}

auto SessionManager::append_message(std::string_view session_id, MessageInput input)
    -> awaitable<Result<ChatMessage>> {
    if (input.content.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Message content must not be empty"));
    }

    auto session = co_await store_->get(session_id);
    if (!session) {
        co_return make_fail(session.error());
    }
    if (session->state == SessionState::Closed) {
        co_return make_fail(make_error(ErrorCode::SessionError,
            "Cannot append to an ended session", session->id));
    }

    std::optional<Timestamp> floor;
    bool seen = false;
    {
        std::lock_guard lock(clock_mutex_);
        seen = last_stamp_.contains(session->id);
    }
    if (!seen) {
        auto latest = co_await store_->latest_message_time(session_id);
        if (!latest) {
            co_return make_fail(latest.error());
        }
        floor = *latest;
    }

    ChatMessage message;
    message.session_id = session->id;
    message.role = input.role;
    message.content = std::move(input.content);
    message.sources = std::move(input.sources);
    message.confidence = input.confidence;
    message.response_time_ms = input.response_time_ms;
    message.degraded = input.degraded;
    message.created_at = next_timestamp(session->id, floor);

    auto stored = co_await store_->append(std::move(message));
    if (!stored) {
        co_return make_fail(stored.error());
    }
    LOG_DEBUG("Appended {} message {} to session {}",
              stored->role == Role::User ? "user" : "assistant", stored->id, stored->session_id);
    co_return stored;
}

auto SessionManager::get_history(std::string_view session_id, size_t limit)
    -> awaitable<Result<std::vector<ChatMessage>>> {
    auto session = co_await store_->get(session_id);
    if (!session) {
        co_return make_fail(session.error());
    }
    co_return co_await store_->messages(session_id, limit == 0 ? history_limit_ : limit);
}

auto SessionManager::end_session(std::string_view id) -> awaitable<Result<void>> {
    auto result = co_await store_->get(id);
    if (!result) {
        co_return make_fail(result.error());
    }

    auto session = std::move(*result);
    if (session.state == SessionState::Closed) {
        co_return ok_result();
    }
    auto now = Clock::now();
    session.state = SessionState::Closed;
    session.ended_at = now;
    session.last_active = std::max(session.last_active, now);

    auto updated = co_await store_->update(session);
    if (!updated) {
        co_return make_fail(updated.error());
    }

    {
        std::lock_guard lock(clock_mutex_);
        last_stamp_.erase(session.id);
    }
    LOG_INFO("Ended chat session {}", id);
    co_return ok_result();
}

auto SessionManager::expire_idle(std::chrono::seconds timeout) -> awaitable<Result<size_t>> {
    auto cutoff = Clock::now() - timeout;
    auto expired = co_await store_->mark_idle(cutoff);
    if (!expired) {
        co_return expired;
    }

    size_t released = 0;
    {
        std::lock_guard lock(clock_mutex_);
        released = std::erase_if(last_stamp_,
            [cutoff](const auto& stamp) { return stamp.second < cutoff; });
    }
    if (*expired > 0 || released > 0) {
        LOG_INFO("Marked {} chat sessions idle, released {} timestamp floors (timeout={}s)",
                 *expired, released, timeout.count());
    }
    co_return expired;
}

auto SessionManager::tracked_sessions() const -> size_t {
    std::lock_guard lock(clock_mutex_);
    return last_stamp_.size();
}

auto SessionManager::session_stats() -> awaitable<Result<SessionStats>> {
    co_return co_await store_->stats();
}

} // namespace dentassist::chat
