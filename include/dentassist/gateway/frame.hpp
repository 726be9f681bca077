#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "dentassist/core/error.hpp"
#include "dentassist/core/types.hpp"

namespace dentassist::gateway {

using json = nlohmann::json;

/// Longest request id a client may send; ids are echoed in every response.
inline constexpr size_t kMaxRequestIdLength = 128;

/// A request frame sent from client to server. Numeric ids are
/// stringified; missing or null params become an empty object.
struct RequestFrame {
    std::string id;
    std::string method;
    json params;
};

void to_json(json& j, const RequestFrame& f);
void from_json(const json& j, RequestFrame& f);

/// A response frame sent from server to client. Exactly one of `result`
/// ("payload" on the wire) and `error` is set.
struct ResponseFrame {
    std::string id;
    bool ok = true;
    std::optional<json> result;
    std::optional<json> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);
void from_json(const json& j, ResponseFrame& f);

/// A server-initiated event pushed to connected clients.
struct EventFrame {
    std::string event;
    json data;
};

void to_json(json& j, const EventFrame& f);
void from_json(const json& j, EventFrame& f);

using Frame = std::variant<RequestFrame, ResponseFrame, EventFrame>;

/// Parse a raw JSON string into a typed Frame.
/// Malformed JSON or fields of the wrong type are SerializationError; a
/// frame of unknown kind or a request without a usable id or method is
/// ProtocolError.
auto parse_frame(std::string_view data) -> Result<Frame>;

auto serialize_frame(const Frame& frame) -> std::string;

auto make_response(const std::string& id, json result) -> ResponseFrame;

auto make_error_response(const std::string& id, ErrorCode code,
                         std::string_view message) -> ResponseFrame;

/// Error response carrying the code, message and detail of `error`.
auto make_error_response(const std::string& id, const Error& error) -> ResponseFrame;

auto make_event(std::string event, json data = json::object()) -> EventFrame;

} // namespace dentassist::gateway
