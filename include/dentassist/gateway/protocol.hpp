#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "dentassist/core/async.hpp"
#include "dentassist/core/error.hpp"
#include "dentassist/gateway/frame.hpp"

namespace dentassist::gateway {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Per-request information handed to method handlers.
struct RequestContext {
    std::string connection_id;
    CancelToken cancel;  // set when the client disconnects
};

/// Signature for an RPC method handler.
/// Receives params as JSON and returns the payload or an Error.
using MethodHandler = std::function<awaitable<Result<json>>(json params, RequestContext ctx)>;

/// Metadata about a registered RPC method.
struct MethodInfo {
    std::string name;
    std::string description;
    std::string group;
};

void to_json(json& j, const MethodInfo& m);

/// Registry of named RPC methods. Routes incoming RequestFrames to the
/// matching handler.
class Protocol {
public:
    Protocol();

    void register_method(std::string name, MethodHandler handler,
                         std::string description = "",
                         std::string group = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    /// All registered methods, sorted by name.
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    [[nodiscard]] auto methods_in_group(std::string_view group) const
        -> std::vector<MethodInfo>;

    /// Dispatch a request to the matching handler.
    /// Unknown methods are NotFound; a throwing handler is an InternalError.
    auto dispatch(const RequestFrame& request, RequestContext ctx = {})
        -> awaitable<Result<json>>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::unordered_map<std::string, Entry> methods_;
};

// ---------------------------------------------------------------------------
// Param helpers
// ---------------------------------------------------------------------------

/// A required string parameter; blank values are rejected.
auto require_string(const json& params, std::string_view key) -> Result<std::string>;

/// A required integer parameter such as an entry id.
auto require_int(const json& params, std::string_view key) -> Result<int64_t>;

/// An optional count such as top_k or limit. Absent or null yields
/// `fallback`; a non-integer or a value below `min` is rejected.
auto optional_count(const json& params, std::string_view key, size_t fallback,
                    size_t min = 0) -> Result<size_t>;

/// An optional string parameter; absent, null or blank yields nullopt.
auto optional_string(const json& params, std::string_view key) -> std::optional<std::string>;

} // namespace dentassist::gateway
