#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dentassist {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Knowledge-base entries are identified by a stable integer id.
using EntryId = int64_t;

/// Embedding vectors are plain float sequences of a fixed dimensionality.
using Embedding = std::vector<float>;

enum class Role {
    User,
    Assistant,
    System,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::System, "system"},
})

/// A single turn handed to a text-generation provider.
struct Message {
    Role role = Role::User;
    std::string content;
};

void to_json(json& j, const Message& m);

enum class BindMode {
    Loopback,
    All,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BindMode, {
    {BindMode::Loopback, "loopback"},
    {BindMode::All, "all"},
})

/// Milliseconds since the Unix epoch; the on-disk representation of Timestamp.
[[nodiscard]] inline auto to_epoch_ms(Timestamp ts) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline auto from_epoch_ms(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::milliseconds{ms}};
}

} // namespace dentassist
