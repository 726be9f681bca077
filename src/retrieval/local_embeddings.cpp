#include "dentassist/retrieval/embeddings.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_set>

namespace dentassist::retrieval {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "is", "are", "was", "were", "be", "been", "am",
        "of", "in", "for", "on", "with", "to", "at", "by", "from", "about",
        "and", "or", "but", "not", "this", "that", "these", "those", "it", "its",
        "what", "which", "who", "whom", "do", "does", "did", "can", "could",
        "would", "should", "will", "shall", "may", "might", "i", "me", "my",
        "you", "your", "yours", "we", "us", "our", "ours", "they", "them", "their",
        "there", "here", "have", "has", "had", "please", "tell", "any", "some",
    };
    return words;
}

// FNV-1a, 64-bit.
auto fnv1a(std::string_view s) -> uint64_t {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

auto stem(std::string word) -> std::string {
    if (word.size() > 3 && word.back() == 's' && word[word.size() - 2] != 's') {
        word.pop_back();
    }
    return word;
}

} // anonymous namespace

LocalEmbeddings::LocalEmbeddings(size_t dimensions)
    : dimensions_(dimensions == 0 ? 384 : dimensions) {}

auto LocalEmbeddings::name() const -> std::string {
    return "local-hash-" + std::to_string(dimensions_);
}

auto LocalEmbeddings::tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> all;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            all.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) all.push_back(std::move(current));

    std::vector<std::string> kept;
    for (const auto& w : all) {
        if (!stop_words().contains(w)) kept.push_back(stem(w));
    }
    // A query made only of stop words still needs some signal.
    if (kept.empty()) {
        for (const auto& w : all) kept.push_back(stem(w));
    }
    return kept;
}

auto LocalEmbeddings::embed_now(std::string_view text) const -> Embedding {
    Embedding vec(dimensions_, 0.0f);
    for (const auto& token : tokenize(text)) {
        auto h = fnv1a(token);
        auto bucket = static_cast<size_t>(h % dimensions_);
        float sign = ((h >> 63) & 1U) ? -1.0f : 1.0f;
        vec[bucket] += sign;
    }

    double norm = 0.0;
    for (float f : vec) norm += static_cast<double>(f) * f;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (float& f : vec) f = static_cast<float>(f / norm);
    }
    return vec;
}

auto LocalEmbeddings::embed(std::string_view text) -> awaitable<Result<Embedding>> {
    if (tokenize(text).empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Cannot embed text without words"));
    }
    co_return embed_now(text);
}

auto LocalEmbeddings::embed_batch(std::vector<std::string> texts)
    -> awaitable<Result<std::vector<Embedding>>> {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& t : texts) {
        if (tokenize(t).empty()) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                           "Cannot embed text without words"));
        }
        out.push_back(embed_now(t));
    }
    co_return out;
}

} // namespace dentassist::retrieval
