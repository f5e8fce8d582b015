#include "core/constants.hpp"
#include "ui/embed_builder.hpp"

#include <chrono>
#include <format>

namespace tagkeeper::ui {

auto embed_builder::build_help(std::string_view prefix) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Tags / Help");

	e.add_field("Slash commands",
							"• `/tag create <name> <content>` create a tag in this server (or a generic one in DMs)\n"
							"• `/tag info <name>` show owner, uses and creation date\n"
							"• `/tag list` list the tags visible here\n"
							"• `/tag edit <name> <content>` replace the content of your tag\n"
							"• `/tag delete <name>` delete your tag\n"
							"• `/tag use <name>` print a tag",
							false);

	e.add_field("Message commands", std::format("• `{0}tag <name>` print a tag\n• `{0}tag create|info|list|edit|delete ...` same as above", prefix), false);

	e.add_field("Notes",
							"• Tag names are case-insensitive and at most 100 characters\n"
							"• Server tags take precedence over generic tags with the same name",
							false);

	return e;
}

auto embed_builder::build_tag_info(const tag &t, const std::optional<user_profile> &owner) -> dpp::embed
{
	dpp::embed e;
	e.set_title(t.name);
	e.add_field("Owner", std::format("<@!{}>", t.owner_id), true);
	e.add_field("Uses", std::to_string(t.uses), true);

	if (owner) {
		e.set_author(owner->name, "", owner->avatar_url);
	}

	e.set_timestamp(std::chrono::system_clock::to_time_t(t.created_at));
	e.set_footer(std::string{t.is_generic() ? constants::text::footer_generic : constants::text::footer_guild}, "");

	return e;
}

auto embed_builder::format_tag_list(std::span<const std::string> names) -> std::string
{
	if (names.empty()) {
		return std::string{constants::text::no_tags};
	}

	std::string out{constants::text::available_tags};
	bool first = true;
	for (const auto &name : names) {
		if (!first)
			out += ", ";
		out += name;
		first = false;
	}

	return out;
}

} // namespace tagkeeper::ui
