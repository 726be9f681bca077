#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "dentassist/core/types.hpp"

namespace dentassist::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto to_iso(Timestamp ts) -> std::string;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Collapses runs of whitespace to a single space and trims both ends.
auto collapse_whitespace(std::string_view s) -> std::string;

/// Truncates to at most max_bytes without splitting a UTF-8 sequence.
auto truncate_utf8(std::string_view s, std::size_t max_bytes) -> std::string;

auto sha256(std::string_view data) -> std::string;

} // namespace dentassist::utils
