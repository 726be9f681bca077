#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dentassist/core/types.hpp"

namespace dentassist::chat {

using json = nlohmann::json;

enum class SessionState {
    Active,
    Idle,
    Closed,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionState, {
    {SessionState::Active, "active"},
    {SessionState::Idle, "idle"},
    {SessionState::Closed, "closed"},
})

/// Knowledge-base entry cited by an assistant turn.
struct SourceRef {
    EntryId id = 0;
    std::string question;
    std::string category;
    std::string source;
    double similarity = 0.0;
};

void to_json(json& j, const SourceRef& s);
void from_json(const json& j, SourceRef& s);

struct ChatSession {
    std::string id;
    std::string user_id;
    SessionState state = SessionState::Active;
    Timestamp started_at;
    Timestamp last_active;
    std::optional<Timestamp> ended_at;
    size_t message_count = 0;
};

void to_json(json& j, const ChatSession& s);

struct ChatMessage {
    int64_t id = 0;
    std::string session_id;
    Role role = Role::User;
    std::string content;
    Timestamp created_at;
    std::vector<SourceRef> sources;
    std::optional<double> confidence;
    std::optional<int64_t> response_time_ms;
    bool degraded = false;
};

void to_json(json& j, const ChatMessage& m);

/// What a caller supplies when appending a turn; the manager assigns the
/// id and timestamp.
struct MessageInput {
    Role role = Role::User;
    std::string content;
    std::vector<SourceRef> sources;
    std::optional<double> confidence;
    std::optional<int64_t> response_time_ms;
    bool degraded = false;
};

struct SessionStats {
    size_t total_sessions = 0;
    size_t active_sessions = 0;
    size_t total_messages = 0;
    size_t user_messages = 0;
    size_t assistant_messages = 0;
    size_t degraded_responses = 0;
    double avg_confidence = 0.0;
    double avg_response_time_ms = 0.0;
};

void to_json(json& j, const SessionStats& s);

} // namespace dentassist::chat
