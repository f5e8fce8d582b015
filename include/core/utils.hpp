#pragma once

#include <dpp/dpp.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tagkeeper {

namespace type {
// Strong type aliases
using timestamp = std::chrono::sys_seconds;

// Guild scope of a request; empty means direct-message context
using guild_context = std::optional<std::uint64_t>;

// Error handling
enum class error_code {
	generic,
	validation, // bad tag name or content
	duplicate,	// name already taken in the target namespace
	not_found,	// name absent from the visible set
	permission, // requester does not own the tag
	io,					// save failed, mutation is in memory only
	corrupt			// persisted file exists but cannot be read back
};

struct error {
	std::string message;
	error_code code{error_code::generic};

	constexpr error(std::string_view sv, error_code c = error_code::generic) : message(sv), code(c) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
	[[nodiscard]] auto is(this const auto &self, error_code c) -> bool { return self.code == c; }
};

using result = std::expected<std::monostate, error>;
} // namespace type

namespace util {
// Force the const conversion operator and silence -Wconversion noise.
[[nodiscard]] constexpr auto id_to_u64(const dpp::snowflake &id) noexcept -> std::uint64_t
{
	// the const qualifier in argument would make it picks operator uint64_t() const
	return static_cast<std::uint64_t>(id);
}

// Zero snowflake (DMs) maps to an empty guild context.
[[nodiscard]] inline auto to_guild_context(const dpp::snowflake &id) -> type::guild_context
{
	if (id.empty()) {
		return std::nullopt;
	}
	return id_to_u64(id);
}

[[nodiscard]] inline auto now() -> type::timestamp { return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now()); }

// ASCII lowercase + surrounding whitespace removed.
[[nodiscard]] auto normalize_name(std::string_view name) -> std::string;
[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

// RFC 3339 in UTC, e.g. 2017-03-04T10:20:30Z
[[nodiscard]] auto format_iso8601(type::timestamp tp) -> std::string;

// Accepts fractional seconds and a Z or +HH:MM / -HH:MM suffix.
[[nodiscard]] auto parse_iso8601(std::string_view text) -> std::optional<type::timestamp>;

// Named project logger, or the spdlog default logger when it has not been registered.
[[nodiscard]] auto logger() -> std::shared_ptr<spdlog::logger>;

} // namespace util

} // namespace tagkeeper
