#include "dentassist/gateway/protocol.hpp"

#include <algorithm>

#include "dentassist/core/logger.hpp"
#include "dentassist/core/utils.hpp"

namespace dentassist::gateway {

void to_json(json& j, const MethodInfo& m) {
    j = json{
        {"name", m.name},
        {"description", m.description},
        {"group", m.group},
    };
}

Protocol::Protocol() = default;

void Protocol::register_method(std::string name, MethodHandler handler,
                               std::string description, std::string group) {
    if (has_method(name)) {
        LOG_WARN("Method {} registered twice; the later handler wins", name);
    } else {
        LOG_DEBUG("Registering method: {}", name);
    }
    methods_[name] = Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = name,
            .description = std::move(description),
            .group = std::move(group),
        },
    };
}

auto Protocol::has_method(std::string_view name) const -> bool {
    return methods_.contains(std::string(name));
}

auto Protocol::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    std::sort(result.begin(), result.end(),
              [](const MethodInfo& a, const MethodInfo& b) { return a.name < b.name; });
    return result;
}

auto Protocol::methods_in_group(std::string_view group) const
    -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    for (auto& info : methods()) {
        if (info.group == group) {
            result.push_back(std::move(info));
        }
    }
    return result;
}

auto Protocol::dispatch(const RequestFrame& request, RequestContext ctx)
    -> awaitable<Result<json>> {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        co_return make_fail(
            make_error(ErrorCode::NotFound,
                       "Method not found: " + request.method));
    }

    if (!request.params.is_object()) {
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument, "params must be a JSON object"));
    }

    try {
        auto result = co_await it->second.handler(request.params, std::move(ctx));
        co_return result;
    } catch (const json::exception& e) {
        LOG_WARN("Method {} rejected params: {}", request.method, e.what());
        co_return make_fail(
            make_error(ErrorCode::InvalidArgument, "Invalid params", e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw exception: {}", request.method, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError,
                       "Method execution failed", e.what()));
    }
}

// ---------------------------------------------------------------------------
// Param helpers
// ---------------------------------------------------------------------------

auto require_string(const json& params, std::string_view key) -> Result<std::string> {
    auto it = params.find(std::string(key));
    if (it == params.end() || !it->is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(key) + " is required"));
    }
    auto value = it->get<std::string>();
    if (utils::trim(value).empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(key) + " must not be blank"));
    }
    return value;
}

auto require_int(const json& params, std::string_view key) -> Result<int64_t> {
    auto it = params.find(std::string(key));
    if (it == params.end() || !it->is_number_integer()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(key) + " must be an integer"));
    }
    return it->get<int64_t>();
}

auto optional_count(const json& params, std::string_view key, size_t fallback, size_t min)
    -> Result<size_t> {
    auto it = params.find(std::string(key));
    if (it == params.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(key) + " must be an integer"));
    }
    // Literals built in C++ arrive signed, parsed JSON arrives unsigned.
    bool below = it->is_number_unsigned()
        ? it->get<uint64_t>() < min
        : it->get<int64_t>() < static_cast<int64_t>(min);
    if (below) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(key) + " must be at least " + std::to_string(min), it->dump()));
    }
    return static_cast<size_t>(it->get<uint64_t>());
}

auto optional_string(const json& params, std::string_view key) -> std::optional<std::string> {
    auto it = params.find(std::string(key));
    if (it == params.end() || !it->is_string()) return std::nullopt;
    auto value = utils::trim(it->get<std::string>());
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace dentassist::gateway
