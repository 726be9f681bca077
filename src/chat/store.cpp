#include "dentassist/chat/store.hpp"

#include <algorithm>
#include <filesystem>

#include "dentassist/core/logger.hpp"

namespace dentassist::chat {

namespace {

auto state_to_string(SessionState state) -> std::string {
    switch (state) {
        case SessionState::Active: return "active";
        case SessionState::Idle:   return "idle";
        case SessionState::Closed: return "closed";
    }
    return "active";
}

auto string_to_state(std::string_view s) -> SessionState {
    if (s == "idle")   return SessionState::Idle;
    if (s == "closed") return SessionState::Closed;
    return SessionState::Active;
}

auto role_to_string(Role role) -> std::string {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "user";
}

auto string_to_role(std::string_view s) -> Role {
    if (s == "assistant") return Role::Assistant;
    if (s == "system")    return Role::System;
    return Role::User;
}

auto read_session(SQLite::Statement& stmt) -> ChatSession {
    ChatSession s;
    s.id = stmt.getColumn(0).getString();
    s.user_id = stmt.getColumn(1).getString();
    s.state = string_to_state(stmt.getColumn(2).getString());
    s.started_at = from_epoch_ms(stmt.getColumn(3).getInt64());
    s.last_active = from_epoch_ms(stmt.getColumn(4).getInt64());
    if (!stmt.getColumn(5).isNull()) {
        s.ended_at = from_epoch_ms(stmt.getColumn(5).getInt64());
    }
    s.message_count = static_cast<size_t>(stmt.getColumn(6).getInt64());
    return s;
}

auto db_error(std::string message, const SQLite::Exception& e) -> Error {
    LOG_ERROR("{}: {}", message, e.what());
    return make_error(ErrorCode::DatabaseError, std::move(message), e.what());
}

} // anonymous namespace

SqliteChatStore::SqliteChatStore(const std::string& db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    try {
        db_ = std::make_unique<SQLite::Database>(
            db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        db_->setBusyTimeout(5000);
        db_->exec("PRAGMA journal_mode=WAL");
        init_schema();
        LOG_INFO("Chat store opened: {}", db_path);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to open chat store: {}", e.what());
        throw;
    }
}

SqliteChatStore::~SqliteChatStore() = default;

void SqliteChatStore::init_schema() {
    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS chat_sessions (
            session_id    TEXT PRIMARY KEY,
            user_id       TEXT NOT NULL,
            state         TEXT NOT NULL DEFAULT 'active',
            started_at    INTEGER NOT NULL,
            last_active   INTEGER NOT NULL,
            ended_at      INTEGER,
            message_count INTEGER NOT NULL DEFAULT 0
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS chat_messages (
            id               INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id       TEXT NOT NULL REFERENCES chat_sessions(session_id),
            role             TEXT NOT NULL,
            content          TEXT NOT NULL,
            sources          TEXT NOT NULL DEFAULT '[]',
            confidence_score REAL,
            response_time_ms INTEGER,
            degraded         INTEGER NOT NULL DEFAULT 0,
            created_at       INTEGER NOT NULL
        )
    )SQL");

    db_->exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_chat_messages_session
            ON chat_messages(session_id, created_at, id)
    )SQL");

    db_->exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_chat_sessions_last_active ON chat_sessions(last_active)
    )SQL");
}

auto SqliteChatStore::create(const ChatSession& session) -> awaitable<Result<void>> {
    bool exists = false;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement lookup(*db_, "SELECT 1 FROM chat_sessions WHERE session_id = ?");
        lookup.bind(1, session.id);
        exists = lookup.executeStep();
        if (!exists) {
            SQLite::Statement stmt(*db_,
                "INSERT INTO chat_sessions (session_id, user_id, state, started_at, "
                "last_active, ended_at, message_count) VALUES (?, ?, ?, ?, ?, NULL, 0)");
            stmt.bind(1, session.id);
            stmt.bind(2, session.user_id);
            stmt.bind(3, state_to_string(session.state));
            stmt.bind(4, to_epoch_ms(session.started_at));
            stmt.bind(5, to_epoch_ms(session.last_active));
            stmt.exec();
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to create session", e));
    }
    if (exists) {
        co_return make_fail(make_error(ErrorCode::AlreadyExists,
            "Session already exists", session.id));
    }
    LOG_DEBUG("Created chat session {}", session.id);
    co_return ok_result();
}

auto SqliteChatStore::get(std::string_view id) -> awaitable<Result<ChatSession>> {
    std::optional<ChatSession> found;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "SELECT session_id, user_id, state, started_at, last_active, ended_at, "
            "message_count FROM chat_sessions WHERE session_id = ?");
        stmt.bind(1, std::string(id));
        if (stmt.executeStep()) {
            found = read_session(stmt);
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to get session", e));
    }
    if (!found) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Session not found",
                                       std::string(id)));
    }
    co_return std::move(*found);
}

auto SqliteChatStore::update(const ChatSession& session) -> awaitable<Result<void>> {
    int rows = 0;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "UPDATE chat_sessions SET state = ?, last_active = ?, ended_at = ? "
            "WHERE session_id = ?");
        stmt.bind(1, state_to_string(session.state));
        stmt.bind(2, to_epoch_ms(session.last_active));
        if (session.ended_at) {
            stmt.bind(3, to_epoch_ms(*session.ended_at));
        } else {
            stmt.bind(3);
        }
        stmt.bind(4, session.id);
        rows = stmt.exec();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to update session", e));
    }
    if (rows == 0) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Session not found", session.id));
    }
    co_return ok_result();
}

auto SqliteChatStore::append(ChatMessage message) -> awaitable<Result<ChatMessage>> {
    try {
        std::lock_guard lock(mutex_);
        SQLite::Transaction txn(*db_);

        SQLite::Statement insert(*db_,
            "INSERT INTO chat_messages (session_id, role, content, sources, confidence_score, "
            "response_time_ms, degraded, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, message.session_id);
        insert.bind(2, role_to_string(message.role));
        insert.bind(3, message.content);
        insert.bind(4, json(message.sources).dump());
        if (message.confidence) {
            insert.bind(5, *message.confidence);
        } else {
            insert.bind(5);
        }
        if (message.response_time_ms) {
            insert.bind(6, *message.response_time_ms);
        } else {
            insert.bind(6);
        }
        insert.bind(7, message.degraded ? 1 : 0);
        insert.bind(8, to_epoch_ms(message.created_at));
        insert.exec();
        message.id = db_->getLastInsertRowid();

        SQLite::Statement bump(*db_,
            "UPDATE chat_sessions SET message_count = message_count + 1, "
            "last_active = MAX(last_active, ?) WHERE session_id = ?");
        bump.bind(1, to_epoch_ms(message.created_at));
        bump.bind(2, message.session_id);
        if (bump.exec() == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Session not found",
                                           message.session_id));
        }
        txn.commit();
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to append message", e));
    }
    co_return message;
}

auto SqliteChatStore::messages(std::string_view session_id, size_t limit)
    -> awaitable<Result<std::vector<ChatMessage>>> {
    std::vector<ChatMessage> out;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "SELECT id, session_id, role, content, sources, confidence_score, "
            "response_time_ms, degraded, created_at FROM chat_messages "
            "WHERE session_id = ? ORDER BY created_at DESC, id DESC LIMIT ?");
        stmt.bind(1, std::string(session_id));
        stmt.bind(2, limit == 0 ? int64_t{-1} : static_cast<int64_t>(limit));
        while (stmt.executeStep()) {
            ChatMessage m;
            m.id = stmt.getColumn(0).getInt64();
            m.session_id = stmt.getColumn(1).getString();
            m.role = string_to_role(stmt.getColumn(2).getString());
            m.content = stmt.getColumn(3).getString();
            m.sources = json::parse(stmt.getColumn(4).getString()).get<std::vector<SourceRef>>();
            if (!stmt.getColumn(5).isNull()) m.confidence = stmt.getColumn(5).getDouble();
            if (!stmt.getColumn(6).isNull()) m.response_time_ms = stmt.getColumn(6).getInt64();
            m.degraded = stmt.getColumn(7).getInt() != 0;
            m.created_at = from_epoch_ms(stmt.getColumn(8).getInt64());
            out.push_back(std::move(m));
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to load messages", e));
    } catch (const json::exception& e) {
        co_return make_fail(make_error(ErrorCode::SerializationError,
            "Corrupt message sources", e.what()));
    }
    std::reverse(out.begin(), out.end());
    co_return out;
}

auto SqliteChatStore::latest_message_time(std::string_view session_id)
    -> awaitable<Result<std::optional<Timestamp>>> {
    std::optional<Timestamp> latest;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "SELECT MAX(created_at) FROM chat_messages WHERE session_id = ?");
        stmt.bind(1, std::string(session_id));
        if (stmt.executeStep() && !stmt.getColumn(0).isNull()) {
            latest = from_epoch_ms(stmt.getColumn(0).getInt64());
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to read latest message time", e));
    }
    co_return latest;
}

auto SqliteChatStore::mark_idle(Timestamp cutoff) -> awaitable<Result<size_t>> {
    size_t rows = 0;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement stmt(*db_,
            "UPDATE chat_sessions SET state = 'idle' "
            "WHERE state = 'active' AND last_active < ?");
        stmt.bind(1, to_epoch_ms(cutoff));
        rows = static_cast<size_t>(stmt.exec());
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to expire idle sessions", e));
    }
    co_return rows;
}

auto SqliteChatStore::stats() -> awaitable<Result<SessionStats>> {
    SessionStats s;
    try {
        std::lock_guard lock(mutex_);
        SQLite::Statement sessions(*db_,
            "SELECT COUNT(*), COALESCE(SUM(CASE WHEN state = 'active' THEN 1 ELSE 0 END), 0) "
            "FROM chat_sessions");
        if (sessions.executeStep()) {
            s.total_sessions = static_cast<size_t>(sessions.getColumn(0).getInt64());
            s.active_sessions = static_cast<size_t>(sessions.getColumn(1).getInt64());
        }

        SQLite::Statement messages(*db_,
            "SELECT COUNT(*), "
            "COALESCE(SUM(CASE WHEN role = 'user' THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(CASE WHEN role = 'assistant' THEN 1 ELSE 0 END), 0), "
            "COALESCE(SUM(degraded), 0), "
            "AVG(CASE WHEN role = 'assistant' THEN confidence_score END), "
            "AVG(CASE WHEN role = 'assistant' THEN response_time_ms END) "
            "FROM chat_messages");
        if (messages.executeStep()) {
            s.total_messages = static_cast<size_t>(messages.getColumn(0).getInt64());
            s.user_messages = static_cast<size_t>(messages.getColumn(1).getInt64());
            s.assistant_messages = static_cast<size_t>(messages.getColumn(2).getInt64());
            s.degraded_responses = static_cast<size_t>(messages.getColumn(3).getInt64());
            if (!messages.getColumn(4).isNull()) s.avg_confidence = messages.getColumn(4).getDouble();
            if (!messages.getColumn(5).isNull()) {
                s.avg_response_time_ms = messages.getColumn(5).getDouble();
            }
        }
    } catch (const SQLite::Exception& e) {
        co_return make_fail(db_error("Failed to compute session stats", e));
    }
    co_return s;
}

} // namespace dentassist::chat
