#pragma once

#include "dentassist/assistant/assistant.hpp"
#include "dentassist/gateway/protocol.hpp"

namespace dentassist::gateway {

/// Registers chat.send, chat.session.create, chat.session.get,
/// chat.session.end, chat.history and chat.stats on the protocol.
void register_chat_handlers(Protocol& protocol, assistant::Assistant& assistant);

} // namespace dentassist::gateway
