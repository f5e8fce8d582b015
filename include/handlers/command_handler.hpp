#pragma once

#include "core/utils.hpp"
#include "handlers/tag_command.hpp"
#include "services/tag_service.hpp"
#include "services/user_directory.hpp"
#include <dpp/dpp.h>

#include <memory>
#include <string>

namespace tagkeeper {

class command_handler {
public:
	// users may be null, info embeds are then rendered without an author line
	explicit command_handler(std::shared_ptr<tag_service> tag_svc, std::shared_ptr<user_directory> users, std::string prefix);

	// Command dispatch
	auto on_slash(const dpp::slashcommand_t &ev) -> void;
	auto on_message(const dpp::message_create_t &ev) -> void;

	// Runs one command against the store and builds the reply.
	[[nodiscard]] auto execute(const tag_command &cmd, type::guild_context guild, std::uint64_t requester) -> std::expected<dpp::message, type::error>;

	// Get command definitions for registration
	[[nodiscard]] static auto commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>;

	// `<prefix>tag rest...` -> words after "tag"; nullopt for any other message.
	[[nodiscard]] static auto match_prefix(std::string_view content, std::string_view prefix) -> std::optional<std::vector<std::string>>;

private:
	std::shared_ptr<tag_service> tag_svc_;
	std::shared_ptr<user_directory> users_;
	std::string prefix_;

	[[nodiscard]] static auto from_slash(const dpp::command_data_option &sub) -> std::expected<tag_command, type::error>;
};

} // namespace tagkeeper
