#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::knowledge {

using json = nlohmann::json;

inline constexpr std::string_view kDefaultCategory = "general";
inline constexpr std::string_view kDefaultSource = "user_defined";

/// A curated question/answer pair.
///
/// An entry is searchable only when it is active and carries an embedding.
/// An edit to question, answer or category clears the embedding until it is
/// regenerated.
struct QAEntry {
    EntryId id = 0;
    std::string question;
    std::string answer;
    std::string category = std::string(kDefaultCategory);
    std::string source = std::string(kDefaultSource);
    std::optional<std::string> source_url;
    bool active = true;
    std::optional<Embedding> embedding;
    std::optional<std::string> embedding_model;
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] auto is_searchable() const noexcept -> bool {
        return active && embedding.has_value() && !embedding->empty();
    }

    /// Active but lacking an embedding: excluded from search, reported to authors.
    [[nodiscard]] auto needs_embedding() const noexcept -> bool {
        return active && (!embedding.has_value() || embedding->empty());
    }
};

/// Serialises the entry for the wire. The embedding vector is omitted;
/// `has_embedding` reports whether one exists.
void to_json(json& j, const QAEntry& e);

/// Fields an author supplies when creating an entry.
struct EntryDraft {
    std::string question;
    std::string answer;
    std::string category = std::string(kDefaultCategory);
    std::string source = std::string(kDefaultSource);
    std::optional<std::string> source_url;
};

void from_json(const json& j, EntryDraft& d);

/// Partial update; unset fields are left unchanged.
struct EntryPatch {
    std::optional<std::string> question;
    std::optional<std::string> answer;
    std::optional<std::string> category;
    std::optional<std::string> source;
    std::optional<std::string> source_url;
    std::optional<bool> active;

    /// True when the patch changes text that the embedding depends on.
    [[nodiscard]] auto invalidates_embedding() const noexcept -> bool {
        return question.has_value() || answer.has_value() || category.has_value();
    }
};

void from_json(const json& j, EntryPatch& p);

/// Trims the text fields, applies defaults, and rejects blank question/answer.
auto validate_draft(EntryDraft draft) -> Result<EntryDraft>;

/// Text an entry is embedded from: "Q: ...\nA: ..." or the bare question.
auto embedding_text(const QAEntry& entry, bool include_answer) -> std::string;

/// Whitespace- and case-insensitive digest of question and answer.
auto content_fingerprint(std::string_view question, std::string_view answer) -> std::string;

} // namespace dentassist::knowledge
