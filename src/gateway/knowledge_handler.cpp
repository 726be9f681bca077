#include "dentassist/gateway/knowledge_handler.hpp"

#include <chrono>

#include <boost/asio/use_awaitable.hpp>

#include "dentassist/core/logger.hpp"

namespace dentassist::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

namespace {

auto entries_to_json(const std::vector<knowledge::QAEntry>& entries) -> json {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back(e);
    }
    return arr;
}

} // anonymous namespace

void register_knowledge_handlers(Protocol& protocol, assistant::Assistant& assistant) {
    // kb.search
    protocol.register_method("kb.search",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto query = require_string(params, "query");
            if (!query) co_return make_fail(query.error());

            auto opts = retrieval::RetrieveOptions::from_config(assistant.config().retrieval);
            auto k = optional_count(params, "top_k", opts.k, 1);
            if (!k) co_return make_fail(k.error());
            opts.k = *k;
            opts.threshold = params.value("threshold", opts.threshold);
            opts.category = optional_string(params, "category");
            opts.deduplicate = params.value("deduplicate", opts.deduplicate);

            auto start = std::chrono::steady_clock::now();
            auto results = co_await assistant.search(*query, opts);
            if (!results) co_return make_fail(results.error());
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();

            json arr = json::array();
            for (const auto& r : *results) {
                arr.push_back(r);
            }
            co_return json{
                {"query", *query},
                {"results", arr},
                {"total_results", results->size()},
                {"search_time_ms", elapsed},
            };
        },
        "Semantic search over the knowledge base", "kb");

    // kb.create
    protocol.register_method("kb.create",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto draft = params.get<knowledge::EntryDraft>();
            auto entry = co_await assistant.author().create(std::move(draft));
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Create a QA entry", "kb");

    // kb.import
    protocol.register_method("kb.import",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            if (!params.contains("entries") || !params["entries"].is_array()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                               "entries must be an array"));
            }
            std::vector<knowledge::EntryDraft> drafts;
            for (const auto& item : params["entries"]) {
                drafts.push_back(item.get<knowledge::EntryDraft>());
            }
            auto created = co_await assistant.author().batch_create(std::move(drafts));
            if (!created) co_return make_fail(created.error());
            co_return json{{"created", created->size()}, {"entries", entries_to_json(*created)}};
        },
        "Create many QA entries at once", "kb");

    // kb.get
    protocol.register_method("kb.get",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto entry = co_await assistant.knowledge().get(*id);
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Get a QA entry", "kb");

    // kb.list
    protocol.register_method("kb.list",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            knowledge::ListFilter filter;
            filter.category = optional_string(params, "category");
            filter.source = optional_string(params, "source");
            filter.include_inactive = params.value("include_inactive", false);
            auto limit = optional_count(params, "limit", filter.limit, 1);
            if (!limit) co_return make_fail(limit.error());
            auto offset = optional_count(params, "offset", filter.offset);
            if (!offset) co_return make_fail(offset.error());
            filter.limit = *limit;
            filter.offset = *offset;

            auto entries = co_await assistant.knowledge().list(filter);
            if (!entries) co_return make_fail(entries.error());
            co_return json{{"entries", entries_to_json(*entries)}, {"count", entries->size()}};
        },
        "List QA entries, newest first", "kb");

    // kb.update
    protocol.register_method("kb.update",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto patch = params.get<knowledge::EntryPatch>();
            auto entry = co_await assistant.author().update(*id, std::move(patch));
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Edit a QA entry", "kb");

    // kb.deactivate
    protocol.register_method("kb.deactivate",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto entry = co_await assistant.author().deactivate(*id);
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Hide a QA entry from search", "kb");

    // kb.reactivate
    protocol.register_method("kb.reactivate",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto entry = co_await assistant.author().reactivate(*id);
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Return a QA entry to search", "kb");

    // kb.duplicate
    protocol.register_method("kb.duplicate",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto entry = co_await assistant.author().duplicate(
                *id, optional_string(params, "question"));
            if (!entry) co_return make_fail(entry.error());
            co_return json(*entry);
        },
        "Copy a QA entry", "kb");

    // kb.delete
    protocol.register_method("kb.delete",
        [&assistant](json params, RequestContext) -> awaitable<Result<json>> {
            auto id = require_int(params, "id");
            if (!id) co_return make_fail(id.error());
            auto removed = co_await assistant.author().remove(*id);
            if (!removed) co_return make_fail(removed.error());
            co_return json{{"id", *id}, {"deleted", true}};
        },
        "Delete a QA entry", "kb");

    // kb.categories
    protocol.register_method("kb.categories",
        [&assistant](json, RequestContext) -> awaitable<Result<json>> {
            auto categories = co_await assistant.knowledge().categories();
            if (!categories) co_return make_fail(categories.error());
            co_return json{{"categories", *categories}};
        },
        "Distinct entry categories", "kb");

    // kb.sources
    protocol.register_method("kb.sources",
        [&assistant](json, RequestContext) -> awaitable<Result<json>> {
            auto sources = co_await assistant.knowledge().sources();
            if (!sources) co_return make_fail(sources.error());
            co_return json{{"sources", *sources}};
        },
        "Distinct entry sources", "kb");

    // kb.stats
    protocol.register_method("kb.stats",
        [&assistant](json, RequestContext) -> awaitable<Result<json>> {
            auto stats = co_await assistant.knowledge().stats();
            if (!stats) co_return make_fail(stats.error());
            auto integrity = co_await assistant.author().integrity_report();
            if (!integrity) co_return make_fail(integrity.error());
            json payload = *stats;
            payload["integrity"] = *integrity;
            payload["index"] = assistant.index().stats();
            co_return payload;
        },
        "Knowledge base and index statistics", "kb");
}

} // namespace dentassist::gateway
