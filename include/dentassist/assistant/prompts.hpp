#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dentassist/chat/session.hpp"
#include "dentassist/core/config.hpp"
#include "dentassist/core/types.hpp"
#include "dentassist/retrieval/retriever.hpp"

namespace dentassist::assistant {

/// Persona and safety rules sent as the system message on every turn.
auto system_prompt(const ClinicConfig& clinic) -> std::string;

/// "Q: ...\nA: ..." blocks separated by blank lines, in rank order.
auto context_block(const std::vector<retrieval::SearchResult>& results) -> std::string;

/// The user instruction. An empty context selects the general-guidance template.
auto user_prompt(std::string_view query, std::string_view context) -> std::string;

/// Static answer used when text generation fails; names the clinic contact.
auto fallback_answer(const ClinicConfig& clinic) -> std::string;

/// The last `max_turns` user/assistant exchanges of `history` as provider messages.
auto history_messages(const std::vector<chat::ChatMessage>& history, size_t max_turns)
    -> std::vector<Message>;

} // namespace dentassist::assistant
