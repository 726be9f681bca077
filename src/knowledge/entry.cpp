#include "dentassist/knowledge/entry.hpp"

#include "dentassist/core/utils.hpp"

namespace dentassist::knowledge {

void to_json(json& j, const QAEntry& e) {
    j = json{
        {"id", e.id},
        {"question", e.question},
        {"answer", e.answer},
        {"category", e.category},
        {"source", e.source},
        {"source_url", e.source_url ? json(*e.source_url) : json(nullptr)},
        {"is_active", e.active},
        {"has_embedding", e.embedding.has_value() && !e.embedding->empty()},
        {"created_at", utils::to_iso(e.created_at)},
        {"updated_at", utils::to_iso(e.updated_at)},
    };
    if (e.embedding_model) j["embedding_model"] = *e.embedding_model;
}

void from_json(const json& j, EntryDraft& d) {
    d.question = j.value("question", "");
    d.answer = j.value("answer", "");
    d.category = j.value("category", std::string(kDefaultCategory));
    d.source = j.value("source", std::string(kDefaultSource));
    if (j.contains("source_url") && j["source_url"].is_string()) {
        d.source_url = j["source_url"].get<std::string>();
    }
}

void from_json(const json& j, EntryPatch& p) {
    if (j.contains("question")) p.question = j["question"].get<std::string>();
    if (j.contains("answer")) p.answer = j["answer"].get<std::string>();
    if (j.contains("category")) p.category = j["category"].get<std::string>();
    if (j.contains("source")) p.source = j["source"].get<std::string>();
    if (j.contains("source_url") && j["source_url"].is_string()) {
        p.source_url = j["source_url"].get<std::string>();
    }
    if (j.contains("is_active")) p.active = j["is_active"].get<bool>();
}

auto validate_draft(EntryDraft draft) -> Result<EntryDraft> {
    draft.question = utils::trim(draft.question);
    draft.answer = utils::trim(draft.answer);
    draft.category = utils::trim(draft.category);
    draft.source = utils::trim(draft.source);

    if (draft.question.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Question must not be empty"));
    }
    if (draft.answer.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Answer must not be empty"));
    }
    if (draft.category.empty()) draft.category = std::string(kDefaultCategory);
    if (draft.source.empty()) draft.source = std::string(kDefaultSource);
    return draft;
}

auto embedding_text(const QAEntry& entry, bool include_answer) -> std::string {
    if (!include_answer) {
        return utils::collapse_whitespace(entry.question);
    }
    return "Q: " + utils::collapse_whitespace(entry.question) +
           "\nA: " + utils::collapse_whitespace(entry.answer);
}

auto content_fingerprint(std::string_view question, std::string_view answer) -> std::string {
    auto normalized = utils::to_lower(utils::collapse_whitespace(question)) + "\n" +
                      utils::to_lower(utils::collapse_whitespace(answer));
    return utils::sha256(normalized);
}

} // namespace dentassist::knowledge
