#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace lfsync::timeutil {

// Format as ISO-8601 UTC with second precision: "2024-05-01T12:34:56Z"
auto iso8601_utc(std::time_t when) -> std::string;

// Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z|+00:00]" as UTC. std::nullopt if malformed.
auto parse_iso8601_utc(std::string_view text) -> std::optional<std::time_t>;

} // namespace lfsync::timeutil
