#include "dentassist/gateway/chat_handler.hpp"

#include <boost/asio/use_awaitable.hpp>

#include "dentassist/core/logger.hpp"

namespace dentassist::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

void register_chat_handlers(Protocol& protocol, assistant::Assistant& assistant) {
    // chat.send
    protocol.register_method("chat.send",
        [&assistant](json params, RequestContext ctx) -> awaitable<Result<json>> {
            auto message = require_string(params, "message");
            if (!message) co_return make_fail(message.error());
            auto session_id = optional_string(params, "session_id").value_or("");

            auto reply = co_await assistant.chat(session_id, *message, ctx.cancel);
            if (!reply) {
                LOG_DEBUG("chat.send on connection {} failed: {}",
                          ctx.connection_id, reply.error().what());
                co_return make_fail(reply.error());
            }
            co_return json(*reply);
        },
        "Answer a patient question in a chat session", "chat");

    // chat.session.create
    protocol.register_method("chat.session.create",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto user_id = optional_string(params, "user_id").value_or("");
            auto session = co_await assistant.sessions().create_session(user_id);
            if (!session) co_return make_fail(session.error());
            co_return json(*session);
        },
        "Start a chat session", "chat");

    // chat.session.get
    protocol.register_method("chat.session.get",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_string(params, "session_id");
            if (!id) co_return make_fail(id.error());
            auto session = co_await assistant.sessions().get_session(*id);
            if (!session) co_return make_fail(session.error());
            co_return json(*session);
        },
        "Get a chat session", "chat");

    // chat.session.end
    protocol.register_method("chat.session.end",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_string(params, "session_id");
            if (!id) co_return make_fail(id.error());
            auto ended = co_await assistant.sessions().end_session(*id);
            if (!ended) co_return make_fail(ended.error());
            co_return json{{"session_id", *id}, {"ended", true}};
        },
        "Close a chat session", "chat");

    // chat.history
    protocol.register_method("chat.history",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_string(params, "session_id");
            if (!id) co_return make_fail(id.error());
            auto limit = params.value("limit", size_t{0});

            auto history = co_await assistant.sessions().get_history(*id, limit);
            if (!history) co_return make_fail(history.error());
            json messages = json::array();
            for (const auto& m : *history) {
                messages.push_back(m);
            }
            co_return json{{"session_id", *id}, {"messages", messages}};
        },
        "Recent messages of a session, oldest first", "chat");

    // chat.stats
    protocol.register_method("chat.stats",
        [&assistant](json, RequestContext) -> awaitable<Result<json>> {
            auto stats = co_await assistant.sessions().session_stats();
            if (!stats) co_return make_fail(stats.error());
            co_return json(*stats);
        },
        "Chat usage statistics", "chat");
}

} // namespace dentassist::gateway
