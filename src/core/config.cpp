#include "core/config.hpp"

#include <cstdlib>
#include <format>
#include <fstream>

namespace tagkeeper {

auto bot_config::from_json(const nlohmann::json &j) -> std::expected<bot_config, type::error>
{
	if (!j.is_object()) {
		return std::unexpected(type::error{"config root must be an object"});
	}

	bot_config cfg;
	try { // The try block is for nlohmann::json
		cfg.token = j.value("token", std::string{});
		cfg.command_prefix = j.value("command_prefix", cfg.command_prefix);
		cfg.tags_file = j.value("tags_file", cfg.tags_file.string());

		if (auto it = j.find("guild_id"); it != j.end() && !it->is_null()) {
			cfg.guild_id = it->get<std::uint64_t>();
		}

		if (auto it = j.find("log_level"); it != j.end()) {
			const auto name = it->get<std::string>();
			const auto level = spdlog::level::from_str(name);
			// from_str maps unknown names to off
			if (level == spdlog::level::off && name != "off") {
				return std::unexpected(type::error{std::format("unknown log_level '{}'", name)});
			}
			cfg.log_level = level;
		}
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("invalid config: {}", e.what())});
	}

	if (cfg.command_prefix.empty()) {
		return std::unexpected(type::error{"command_prefix must not be empty"});
	}

	return cfg;
}

auto bot_config::load(const std::filesystem::path &path) -> std::expected<bot_config, type::error>
{
	bot_config cfg;

	if (std::filesystem::exists(path)) {
		try { // The try block is for nlohmann::json
			std::ifstream file(path);
			nlohmann::json j;
			file >> j;

			if (auto res = from_json(j)) {
				cfg = std::move(*res);
			}
			else {
				return std::unexpected(type::error{std::format("{}: {}", path.string(), res.error().what())});
			}
		} catch (const std::exception &e) {
			return std::unexpected(type::error{std::format("Failed to read {}: {}", path.string(), e.what())});
		}
	}

	if (const char *env = std::getenv("DISCORD_BOT_TOKEN"); env != nullptr && *env != '\0') {
		cfg.token = env;
	}

	if (cfg.token.empty()) {
		std::ifstream(std::string{constants::files::token_file}) >> cfg.token;
	}

	if (cfg.token.empty()) {
		return std::unexpected(type::error{"No bot token: set DISCORD_BOT_TOKEN, \"token\" in the config, or a .bot_token file"});
	}

	return cfg;
}

} // namespace tagkeeper
