#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "ui/embed_builder.hpp"
#include "ui/message_builder.hpp"

#include <cctype>
#include <format>

namespace tagkeeper {

namespace {

auto option_string(const dpp::command_data_option &sub, std::string_view key) -> std::string
{
	for (const auto &opt : sub.options) {
		if (opt.name == key && std::holds_alternative<std::string>(opt.value)) {
			return std::get<std::string>(opt.value);
		}
	}
	return {};
}

} // namespace

command_handler::command_handler(std::shared_ptr<tag_service> tag_svc, std::shared_ptr<user_directory> users, std::string prefix)
		: tag_svc_(std::move(tag_svc)), users_(std::move(users)), prefix_(std::move(prefix))
{
}

auto command_handler::commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>
{
	std::vector<dpp::slashcommand> cmds;

	auto name_opt = [] { return dpp::command_option(dpp::co_string, "name", "Tag name", true); };
	auto content_opt = [] { return dpp::command_option(dpp::co_string, "content", "Tag content", true); };

	dpp::slashcommand tag_cmd("tag", "Create, show and manage tags", bot_id);
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "create", "Create a tag").add_option(name_opt()).add_option(content_opt()));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "info", "Show tag details").add_option(name_opt()));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "list", "List available tags"));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "edit", "Edit one of your tags").add_option(name_opt()).add_option(content_opt()));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "delete", "Delete one of your tags").add_option(name_opt()));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "use", "Print a tag").add_option(name_opt()));
	tag_cmd.add_option(dpp::command_option(dpp::co_sub_command, "help", "Show help"));
	cmds.push_back(std::move(tag_cmd));

	return cmds;
}

auto command_handler::from_slash(const dpp::command_data_option &sub) -> std::expected<tag_command, type::error>
{
	const auto name = util::normalize_name(option_string(sub, "name"));

	if (sub.name == "create")
		return create_cmd{.name = name, .content = option_string(sub, "content")};
	if (sub.name == "info")
		return info_cmd{.name = name};
	if (sub.name == "list")
		return list_cmd{};
	if (sub.name == "edit")
		return edit_cmd{.name = name, .content = option_string(sub, "content")};
	if (sub.name == "delete")
		return delete_cmd{.name = name};
	if (sub.name == "use")
		return invoke_cmd{.name = name};

	return std::unexpected(type::error{constants::text::unknown_command});
}

auto command_handler::on_slash(const dpp::slashcommand_t &ev) -> void
{
	if (ev.command.get_command_name() != "tag") {
		return ui::message_builder::reply_error(ev, constants::text::unknown_command);
	}

	auto interaction = ev.command.get_command_interaction();
	if (interaction.options.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::usage);
	}

	const auto &sub = interaction.options.front();
	if (sub.name == "help") {
		return ev.reply(dpp::message().add_embed(ui::embed_builder::build_help(prefix_)).set_flags(dpp::m_ephemeral));
	}

	auto cmd = from_slash(sub);
	if (!cmd) {
		return ui::message_builder::reply_error(ev, cmd.error());
	}

	auto reply = execute(*cmd, util::to_guild_context(ev.command.guild_id), util::id_to_u64(ev.command.usr.id));
	if (!reply) {
		return ui::message_builder::reply_error(ev, reply.error());
	}

	return ev.reply(*reply);
}

auto command_handler::match_prefix(std::string_view content, std::string_view prefix) -> std::optional<std::vector<std::string>>
{
	if (!content.starts_with(prefix)) {
		return std::nullopt;
	}
	content.remove_prefix(prefix.size());

	constexpr std::string_view kCommand = "tag";
	if (!content.starts_with(kCommand)) {
		return std::nullopt;
	}
	content.remove_prefix(kCommand.size());

	// "!tags" is not "!tag s"
	if (!content.empty() && std::isspace(static_cast<unsigned char>(content.front())) == 0) {
		return std::nullopt;
	}

	return split_args(content);
}

auto command_handler::on_message(const dpp::message_create_t &ev) -> void
{
	if (ev.msg.author.is_bot()) {
		return;
	}

	auto args = match_prefix(ev.msg.content, prefix_);
	if (!args) {
		return;
	}

	util::logger()->info("Got command 'tag' from user '{}'", ev.msg.author.username);

	auto cmd = parse_tag_command(*args);
	if (!cmd) {
		return ui::message_builder::reply_error(ev, cmd.error());
	}

	auto reply = execute(*cmd, util::to_guild_context(ev.msg.guild_id), util::id_to_u64(ev.msg.author.id));
	if (!reply) {
		return ui::message_builder::reply_error(ev, reply.error());
	}

	ev.reply(*reply);
}

auto command_handler::execute(const tag_command &cmd, type::guild_context guild, std::uint64_t requester) -> std::expected<dpp::message, type::error>
{
	using reply_t = std::expected<dpp::message, type::error>;

	return std::visit(overloaded{[&](const create_cmd &c) -> reply_t {
																 auto res = tag_svc_->create_tag(guild, c.name, c.content, requester);
																 if (!res) {
																	 return std::unexpected(res.error());
																 }
																 return ui::message_builder::success(std::format("Tag \"{}\" successfully created.", res->name));
															 },
															 [&](const info_cmd &c) -> reply_t {
																 auto res = tag_svc_->get_tag(guild, c.name);
																 if (!res) {
																	 return std::unexpected(res.error());
																 }
																 auto owner = users_ ? users_->find(res->owner_id) : std::nullopt;
																 return dpp::message().add_embed(ui::embed_builder::build_tag_info(*res, owner));
															 },
															 [&](const list_cmd &) -> reply_t {
																 auto names = tag_svc_->list_tags(guild);
																 return ui::message_builder::plain(ui::embed_builder::format_tag_list(names));
															 },
															 [&](const edit_cmd &c) -> reply_t {
																 auto res = tag_svc_->edit_tag(guild, c.name, c.content, requester);
																 if (!res) {
																	 return std::unexpected(res.error());
																 }
																 return ui::message_builder::success(std::format("Tag \"{}\" successfully updated.", c.name));
															 },
															 [&](const delete_cmd &c) -> reply_t {
																 if (auto res = tag_svc_->delete_tag(guild, c.name, requester); !res) {
																	 return std::unexpected(res.error());
																 }
																 return ui::message_builder::success(std::format("Tag \"{}\" successfully deleted.", c.name));
															 },
															 [&](const invoke_cmd &c) -> reply_t {
																 auto res = tag_svc_->increment_use(guild, c.name);
																 if (!res) {
																	 return std::unexpected(res.error());
																 }
																 return ui::message_builder::plain(res->content);
															 }},
										cmd);
}

} // namespace tagkeeper
