#include "dentassist/gateway/system_handler.hpp"

#include <boost/asio/use_awaitable.hpp>

#include "dentassist/core/logger.hpp"

namespace dentassist::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

void register_system_handlers(Protocol& protocol, assistant::Assistant& assistant) {
    // system.rebuild_index
    protocol.register_method("system.rebuild_index",
        [&assistant](json params, RequestContext ctx) -> awaitable<Result<json>> {
            auto reembed = params.value("reembed", false);
            LOG_INFO("Index rebuild requested by connection {} (reembed={})",
                     ctx.connection_id, reembed);
            auto report = co_await assistant.rebuild_index(reembed);
            if (!report) co_return make_fail(report.error());
            co_return json(*report);
        },
        "Re-embed missing entries and rebuild the vector index", "system");

    // system.status
    protocol.register_method("system.status",
        [&assistant](json, RequestContext) -> awaitable<Result<json>> {
            auto status = co_await assistant.status();
            if (!status) co_return make_fail(status.error());
            co_return *status;
        },
        "Health of the index, knowledge base and sessions", "system");

    // system.methods
    protocol.register_method("system.methods",
        [&protocol](json params, RequestContext) -> awaitable<Result<json>> {
            auto group = optional_string(params, "group");
            auto infos = group ? protocol.methods_in_group(*group) : protocol.methods();
            co_return json{{"methods", infos}};
        },
        "List registered methods", "system");
}

} // namespace dentassist::gateway
