#pragma once

#include "dentassist/assistant/assistant.hpp"
#include "dentassist/gateway/protocol.hpp"

namespace dentassist::gateway {

/// Registers the kb.* search and authoring methods on the protocol.
void register_knowledge_handlers(Protocol& protocol, assistant::Assistant& assistant);

} // namespace dentassist::gateway
