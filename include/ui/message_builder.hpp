#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include <dpp/dpp.h>

#include <format>
#include <string_view>
#include <type_traits>

namespace tagkeeper::ui {

// for type safety
template <typename T>
concept Replyable = requires(T t, dpp::message m) { t.reply(m); };

class message_builder {
public:
	[[nodiscard]] static auto error(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::err_prefix, msg)}; }

	[[nodiscard]] static auto success(std::string_view msg) -> dpp::message { return dpp::message{std::format("{}{}", constants::text::ok_prefix, msg)}; }

	// Plain text, mentions disabled so tag content cannot ping anyone.
	[[nodiscard]] static auto plain(std::string_view msg) -> dpp::message
	{
		dpp::message m{std::string{msg}};
		m.set_allowed_mentions(false, false, false, false, {}, {});
		return m;
	}

	// The user-facing text for an error; a failed save never reads as success.
	[[nodiscard]] static auto describe(const type::error &err) -> std::string_view
	{
		if (err.is(type::error_code::io)) {
			return constants::text::not_saved;
		}
		return err.what();
	}

	static auto reply_error(Replyable auto &event, std::string_view msg) -> void
	{
		// Only interaction replies can be ephemeral.
		if constexpr (std::is_same_v<std::remove_cvref_t<decltype(event)>, dpp::slashcommand_t>) {
			event.reply(error(msg).set_flags(dpp::m_ephemeral));
		}
		else {
			event.reply(error(msg));
		}
	}

	static auto reply_error(Replyable auto &event, const type::error &err) -> void { reply_error(event, describe(err)); }
};

} // namespace tagkeeper::ui
