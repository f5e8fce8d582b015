#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tagkeeper {

struct bot_config {
	std::string token{};
	std::string command_prefix{"!"};
	std::filesystem::path tags_file{constants::files::tags_file};
	std::optional<std::uint64_t> guild_id{}; // register slash commands here instead of globally
	spdlog::level::level_enum log_level{spdlog::level::info};

	// Fields absent from the JSON keep their defaults.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> std::expected<bot_config, type::error>;

	// Missing file yields defaults; malformed JSON is an error. The token is then resolved
	// from DISCORD_BOT_TOKEN, the file's "token" field, or the .bot_token file, in that order.
	[[nodiscard]] static auto load(const std::filesystem::path &path) -> std::expected<bot_config, type::error>;
};

} // namespace tagkeeper
