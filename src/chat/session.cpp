#include "dentassist/chat/session.hpp"

#include "dentassist/core/utils.hpp"

namespace dentassist::chat {

void to_json(json& j, const SourceRef& s) {
    j = json{
        {"id", s.id},
        {"question", s.question},
        {"category", s.category},
        {"source", s.source},
        {"similarity_score", s.similarity},
    };
}

void from_json(const json& j, SourceRef& s) {
    s.id = j.value("id", EntryId{0});
    s.question = j.value("question", "");
    s.category = j.value("category", "");
    s.source = j.value("source", "");
    s.similarity = j.value("similarity_score", 0.0);
}

void to_json(json& j, const ChatSession& s) {
    j = json{
        {"session_id", s.id},
        {"user_id", s.user_id},
        {"state", s.state},
        {"is_active", s.state != SessionState::Closed},
        {"started_at", utils::to_iso(s.started_at)},
        {"last_active", utils::to_iso(s.last_active)},
        {"ended_at", s.ended_at ? json(utils::to_iso(*s.ended_at)) : json(nullptr)},
        {"message_count", s.message_count},
    };
}

void to_json(json& j, const ChatMessage& m) {
    j = json{
        {"id", m.id},
        {"session_id", m.session_id},
        {"role", m.role},
        {"content", m.content},
        {"timestamp", utils::to_iso(m.created_at)},
        {"sources", m.sources},
        {"confidence_score", m.confidence ? json(*m.confidence) : json(nullptr)},
        {"response_time_ms", m.response_time_ms ? json(*m.response_time_ms) : json(nullptr)},
        {"degraded", m.degraded},
    };
}

void to_json(json& j, const SessionStats& s) {
    j = json{
        {"total_sessions", s.total_sessions},
        {"active_sessions", s.active_sessions},
        {"total_messages", s.total_messages},
        {"user_messages", s.user_messages},
        {"assistant_messages", s.assistant_messages},
        {"degraded_responses", s.degraded_responses},
        {"avg_confidence_score", s.avg_confidence},
        {"avg_response_time_ms", s.avg_response_time_ms},
    };
}

} // namespace dentassist::chat
