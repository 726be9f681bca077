#include "dentassist/assistant/responder.hpp"

#include <chrono>

#include "dentassist/assistant/prompts.hpp"
#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::assistant {

namespace {

constexpr std::string_view kAnonymousUser = "anonymous";

auto to_sources(const std::vector<retrieval::SearchResult>& results)
    -> std::vector<chat::SourceRef> {
    std::vector<chat::SourceRef> out;
    out.reserve(results.size());
    for (const auto& r : results) {
        out.push_back(chat::SourceRef{
            .id = r.id,
            .question = r.question,
            .category = r.category,
            .source = r.source,
            .similarity = r.similarity,
        });
    }
    return out;
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

void to_json(json& j, const ChatReply& r) {
    j = json{
        {"session_id", r.session_id},
        {"response", r.answer},
        {"sources", r.sources},
        {"confidence_score", r.confidence},
        {"degraded", r.degraded},
        {"response_time_ms", r.response_time_ms},
        {"search_results_count", r.search_results_count},
    };
}

ResponseAssembler::ResponseAssembler(std::shared_ptr<retrieval::Retriever> retriever,
                                     std::shared_ptr<chat::SessionManager> sessions,
                                     std::shared_ptr<providers::Provider> generator,
                                     GenerationConfig generation,
                                     RetrievalConfig retrieval,
                                     ClinicConfig clinic)
    : retriever_(std::move(retriever))
    , sessions_(std::move(sessions))
    , generator_(std::move(generator))
    , generation_(std::move(generation))
    , retrieval_(std::move(retrieval))
    , clinic_(std::move(clinic))
    , scorer_(retrieval_.confidence_floor_weight) {}

auto ResponseAssembler::generate(std::vector<Message> messages, std::string system)
    -> awaitable<Result<std::string>> {
    providers::CompletionRequest req;
    req.model = generation_.model;
    req.messages = std::move(messages);
    req.system_prompt = std::move(system);
    req.temperature = generation_.temperature;
    req.max_tokens = generation_.max_tokens;

    auto generator = generator_;
    auto completion = co_await with_timeout<providers::CompletionResponse>(
        [generator, req = std::move(req)]() { return generator->complete(req); },
        std::chrono::milliseconds(generation_.timeout_ms), "Text generation");
    if (!completion) {
        co_return make_fail(make_error(ErrorCode::GenerationUnavailable,
            "Text generation failed", completion.error().what()));
    }

    LOG_DEBUG("Generation by {} finished ({}): {} prompt tokens, {} completion tokens",
              completion->model, completion->stop_reason,
              completion->input_tokens, completion->output_tokens);

    auto text = utils::trim(completion->message.content);
    if (text.empty()) {
        co_return make_fail(make_error(ErrorCode::GenerationUnavailable,
            "Text generation returned an empty answer"));
    }
    co_return text;
}

auto ResponseAssembler::respond(std::string session_id, std::string query, CancelToken cancel)
    -> awaitable<Result<ChatReply>> {
    auto started = std::chrono::steady_clock::now();

    query = utils::trim(query);
    if (query.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Query is empty"));
    }

    auto session = co_await sessions_->open_session(session_id, kAnonymousUser);
    if (!session) {
        co_return make_fail(session.error());
    }

    // Earlier turns give the model conversational context.
    std::vector<Message> messages;
    if (generation_.history_turns > 0) {
        auto history = co_await sessions_->get_history(session->id,
                                                       generation_.history_turns * 2);
        if (history) {
            messages = history_messages(*history, generation_.history_turns);
        } else {
            LOG_WARN("History unavailable for session {}: {}", session->id,
                     history.error().what());
        }
    }

    auto user_turn = co_await sessions_->append_message(session->id,
        chat::MessageInput{.role = Role::User, .content = query});
    if (!user_turn) {
        co_return make_fail(user_turn.error());
    }

    auto options = retrieval::RetrieveOptions::from_config(retrieval_);
    options.session_id = session->id;
    std::vector<retrieval::SearchResult> results;
    auto found = co_await retriever_->retrieve(query, options);
    if (found) {
        results = std::move(*found);
    } else {
        LOG_WARN("Retrieval failed for session {}, answering without context: {}",
                 session->id, found.error().what());
    }

    if (cancel.cancelled()) {
        LOG_DEBUG("Chat turn in session {} abandoned before generation", session->id);
        co_return make_fail(make_error(ErrorCode::Cancelled, "Request abandoned"));
    }

    messages.push_back(Message{
        .role = Role::User,
        .content = user_prompt(query, context_block(results)),
    });
    auto generated = co_await generate(std::move(messages), system_prompt(clinic_));

    if (cancel.cancelled()) {
        LOG_DEBUG("Chat turn in session {} abandoned during generation", session->id);
        co_return make_fail(make_error(ErrorCode::Cancelled, "Request abandoned"));
    }

    ChatReply reply;
    reply.session_id = session->id;
    reply.search_results_count = results.size();
    if (generated) {
        reply.answer = std::move(*generated);
        reply.sources = to_sources(results);
        reply.confidence = scorer_.score(results);
    } else {
        LOG_WARN("Returning fallback answer for session {}: {}", session->id,
                 generated.error().what());
        reply.answer = fallback_answer(clinic_);
        reply.degraded = true;
    }
    reply.response_time_ms = elapsed_ms(started);

    auto assistant_turn = co_await sessions_->append_message(session->id,
        chat::MessageInput{
            .role = Role::Assistant,
            .content = reply.answer,
            .sources = reply.sources,
            .confidence = reply.confidence,
            .response_time_ms = reply.response_time_ms,
            .degraded = reply.degraded,
        });
    if (!assistant_turn) {
        LOG_ERROR("Failed to persist reply in session {}: {}", session->id,
                  assistant_turn.error().what());
    }

    LOG_INFO("Chat turn in session {}: {} sources, confidence {:.2f}, {}ms{}",
             reply.session_id, reply.sources.size(), reply.confidence,
             reply.response_time_ms, reply.degraded ? " (fallback)" : "");
    co_return reply;
}

} // namespace dentassist::assistant
