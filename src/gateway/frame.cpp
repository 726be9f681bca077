#include "dentassist/gateway/frame.hpp"

namespace dentassist::gateway {

namespace {

enum class FrameKind { Request, Response, Event };

/// Explicit "type" wins; otherwise the kind is inferred from the fields present.
auto detect_kind(const json& j) -> Result<FrameKind> {
    if (j.contains("type") && j["type"].is_string()) {
        const auto& type = j["type"].get_ref<const std::string&>();
        if (type == "req") return FrameKind::Request;
        if (type == "res") return FrameKind::Response;
        if (type == "event") return FrameKind::Event;
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "Unknown frame type: " + type));
    }
    if (j.contains("method")) return FrameKind::Request;
    if (j.contains("event")) return FrameKind::Event;
    if (j.contains("id") && (j.contains("payload") || j.contains("error"))) {
        return FrameKind::Response;
    }
    return std::unexpected(make_error(ErrorCode::ProtocolError,
                                      "Cannot determine frame type from JSON"));
}

auto check_request(const RequestFrame& f) -> Result<void> {
    if (f.id.empty() || f.id.size() > kMaxRequestIdLength) {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
            "Request id must be 1 to " + std::to_string(kMaxRequestIdLength) + " characters"));
    }
    if (f.method.empty()) {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "Request method is required"));
    }
    return {};
}

/// The "error" object of a response frame.
auto error_body(const Error& error) -> json {
    json body = {
        {"code", std::string(error_code_to_string(error.code()))},
        {"message", std::string(error.message())},
    };
    if (!error.detail().empty()) {
        body["detail"] = std::string(error.detail());
    }
    return body;
}

} // anonymous namespace

// -- RequestFrame --

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"type", "req"},
        {"id", f.id},
        {"method", f.method},
        {"params", f.params},
    };
}

void from_json(const json& j, RequestFrame& f) {
    // Numeric ids are accepted and echoed back as strings.
    const auto& id = j.at("id");
    f.id = id.is_string() ? id.get<std::string>() : id.dump();
    j.at("method").get_to(f.method);
    auto params = j.find("params");
    f.params = (params == j.end() || params->is_null()) ? json::object() : *params;
}

// -- ResponseFrame --

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"type", "res"},
        {"id", f.id},
        {"ok", f.ok},
    };
    if (f.result) j["payload"] = *f.result;
    if (f.error) j["error"] = *f.error;
}

void from_json(const json& j, ResponseFrame& f) {
    j.at("id").get_to(f.id);
    f.ok = j.value("ok", true);
    if (j.contains("payload")) f.result = j.at("payload");
    if (j.contains("error")) {
        f.error = j.at("error");
        f.ok = false;
    }
}

// -- EventFrame --

void to_json(json& j, const EventFrame& f) {
    j = json{
        {"type", "event"},
        {"event", f.event},
        {"payload", f.data},
    };
}

void from_json(const json& j, EventFrame& f) {
    j.at("event").get_to(f.event);
    auto payload = j.find("payload");
    f.data = (payload == j.end()) ? json::object() : *payload;
}

// -- Parsing and serialization --

auto parse_frame(std::string_view data) -> Result<Frame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to parse frame JSON", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "Frame must be a JSON object"));
    }

    auto kind = detect_kind(j);
    if (!kind) {
        return std::unexpected(kind.error());
    }

    try {
        switch (*kind) {
            case FrameKind::Request: {
                auto f = j.get<RequestFrame>();
                if (auto ok = check_request(f); !ok) {
                    return std::unexpected(ok.error());
                }
                return Frame{std::move(f)};
            }
            case FrameKind::Response:
                return Frame{j.get<ResponseFrame>()};
            case FrameKind::Event:
                return Frame{j.get<EventFrame>()};
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to deserialize frame fields", e.what()));
    }
    return std::unexpected(make_error(ErrorCode::InternalError, "Unhandled frame kind"));
}

auto serialize_frame(const Frame& frame) -> std::string {
    json j;
    std::visit([&j](const auto& f) { to_json(j, f); }, frame);
    // Answers may quote user text verbatim; never let bad UTF-8 throw here.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// -- Factory helpers --

auto make_response(const std::string& id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = true,
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(const std::string& id, ErrorCode code,
                         std::string_view message) -> ResponseFrame {
    return make_error_response(id, make_error(code, std::string(message)));
}

auto make_error_response(const std::string& id, const Error& error) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = false,
        .result = std::nullopt,
        .error = error_body(error),
    };
}

auto make_event(std::string event, json data) -> EventFrame {
    return EventFrame{
        .event = std::move(event),
        .data = std::move(data),
    };
}

} // namespace dentassist::gateway
