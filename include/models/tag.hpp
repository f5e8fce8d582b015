#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <compare>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace tagkeeper {

class tag {
public:
	std::string name;
	std::string content;
	std::uint64_t owner_id{};
	std::uint32_t uses{};
	std::optional<std::string> location{}; // empty = generic
	type::timestamp created_at{};

	[[nodiscard]] auto operator<=>(const tag &) const = default;

	[[nodiscard]] auto is_generic(this const auto &self) -> bool { return !self.location.has_value(); }

	// Key of the bucket this record belongs to.
	[[nodiscard]] auto namespace_key(this const auto &self) -> std::string
	{
		return self.location.value_or(std::string{constants::store::generic_namespace});
	}

	// explicit object parameter for const correctness
	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json j{{"name", self.name},
										 {"content", self.content},
										 {"owner_id", self.owner_id},
										 {"uses", self.uses},
										 {"location", nullptr},
										 {"created_at", util::format_iso8601(self.created_at)}};
		if (self.location) {
			j["location"] = *self.location;
		}
		return j;
	}

	// Throws nlohmann::json::exception on missing/mistyped required fields,
	// std::invalid_argument on negative or out-of-range counters.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> tag
	{
		const auto &owner = j.at("owner_id");
		if (!owner.is_number_unsigned()) {
			throw std::invalid_argument(std::format("owner_id must be an unsigned integer, got {}", owner.dump()));
		}

		std::uint32_t uses = 0;
		if (auto it = j.find("uses"); it != j.end()) {
			if (!it->is_number_unsigned() || it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
				throw std::invalid_argument(std::format("uses must be an unsigned 32-bit integer, got {}", it->dump()));
			}
			uses = it->get<std::uint32_t>();
		}

		tag t{.name = j.at("name").get<std::string>(),
					.content = j.at("content").get<std::string>(),
					.owner_id = owner.get<std::uint64_t>(),
					.uses = uses,
					.location = std::nullopt,
					.created_at = util::now()};

		if (auto it = j.find("location"); it != j.end() && !it->is_null()) {
			auto loc = it->get<std::string>();
			// older files spelled the generic bucket out
			if (loc != constants::store::generic_namespace) {
				t.location = std::move(loc);
			}
		}

		if (auto it = j.find("created_at"); it != j.end() && !it->is_null()) {
			auto raw = it->get<std::string>();
			auto parsed = util::parse_iso8601(raw);
			if (!parsed) {
				throw std::invalid_argument(std::format("invalid created_at timestamp '{}'", raw));
			}
			t.created_at = *parsed;
		}

		return t;
	}

	// Expects a name already normalized by util::normalize_name.
	[[nodiscard]] static auto validate_name(std::string_view name) -> type::result
	{
		if (name.empty()) {
			return std::unexpected(type::error{constants::text::name_empty, type::error_code::validation});
		}

		if (std::ranges::any_of(constants::limits::blocked_name_words, [name](std::string_view word) { return name.contains(word); })) {
			return std::unexpected(type::error{constants::text::name_blocked, type::error_code::validation});
		}

		if (name.size() > constants::limits::max_tag_name_length) {
			return std::unexpected(type::error{constants::text::name_too_long, type::error_code::validation});
		}

		return std::monostate{};
	}

	[[nodiscard]] static auto validate_content(std::string_view content) -> type::result
	{
		if (util::trim(content).empty()) {
			return std::unexpected(type::error{constants::text::missing_content, type::error_code::validation});
		}
		return std::monostate{};
	}
};

// tag name -> record
using tag_bucket = std::unordered_map<std::string, tag>;

// namespace key ("generic" or a guild id) -> bucket
using namespace_map = std::unordered_map<std::string, tag_bucket>;

} // namespace tagkeeper
