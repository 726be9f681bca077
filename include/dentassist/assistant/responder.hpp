#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/chat/manager.hpp"
#include "dentassist/core/async.hpp"
#include "dentassist/core/config.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/providers/provider.hpp"
#include "dentassist/retrieval/confidence.hpp"
#include "dentassist/retrieval/retriever.hpp"

namespace dentassist::assistant {

using boost::asio::awaitable;

/// Outcome of one chat turn.
struct ChatReply {
    std::string session_id;
    std::string answer;
    std::vector<chat::SourceRef> sources;
    double confidence = 0.0;
    bool degraded = false;  // answer is the static fallback
    int64_t response_time_ms = 0;
    size_t search_results_count = 0;
};

void to_json(json& j, const ChatReply& r);

/// Runs a chat turn end to end: retrieval, prompt assembly, generation,
/// confidence scoring and persistence of both turns.
///
/// Retrieval failures fall through to the no-context prompt. Generation
/// failures and timeouts yield the static fallback answer with
/// `degraded = true`. If the caller cancels while generation is in flight,
/// scoring and persistence of the reply are skipped and Cancelled is
/// returned.
class ResponseAssembler {
public:
    ResponseAssembler(std::shared_ptr<retrieval::Retriever> retriever,
                      std::shared_ptr<chat::SessionManager> sessions,
                      std::shared_ptr<providers::Provider> generator,
                      GenerationConfig generation,
                      RetrievalConfig retrieval,
                      ClinicConfig clinic);

    auto respond(std::string session_id, std::string query, CancelToken cancel = {})
        -> awaitable<Result<ChatReply>>;

private:
    auto generate(std::vector<Message> messages, std::string system)
        -> awaitable<Result<std::string>>;

    std::shared_ptr<retrieval::Retriever> retriever_;
    std::shared_ptr<chat::SessionManager> sessions_;
    std::shared_ptr<providers::Provider> generator_;
    GenerationConfig generation_;
    RetrievalConfig retrieval_;
    ClinicConfig clinic_;
    retrieval::ConfidenceScorer scorer_;
};

} // namespace dentassist::assistant
