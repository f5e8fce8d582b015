#pragma once

#include "models/tag.hpp"
#include "services/user_directory.hpp"
#include <dpp/dpp.h>

#include <optional>
#include <span>
#include <string>

namespace tagkeeper::ui {

class embed_builder {
public:
	// Build help embed
	[[nodiscard]] static auto build_help(std::string_view prefix) -> dpp::embed;

	// Tag details; the author line is left out when the owner could not be resolved
	[[nodiscard]] static auto build_tag_info(const tag &t, const std::optional<user_profile> &owner) -> dpp::embed;

	// "Available tags: a, b, c" or the empty-list text
	[[nodiscard]] static auto format_tag_list(std::span<const std::string> names) -> std::string;
};

} // namespace tagkeeper::ui
