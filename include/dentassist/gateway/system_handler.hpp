#pragma once

#include "dentassist/assistant/assistant.hpp"
#include "dentassist/gateway/protocol.hpp"

namespace dentassist::gateway {

/// Registers system.rebuild_index, system.status and system.methods.
void register_system_handlers(Protocol& protocol, assistant::Assistant& assistant);

} // namespace dentassist::gateway
