#include "core/config.hpp"
#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "services/persistence_service.hpp"
#include "services/tag_service.hpp"
#include "services/user_directory.hpp"
#include "ui/message_builder.hpp"
#include <dpp/dpp.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace tagkeeper;

namespace {

auto to_spdlog_level(dpp::loglevel level) -> spdlog::level::level_enum
{
	switch (level) {
	case dpp::ll_trace:
		return spdlog::level::trace;
	case dpp::ll_debug:
		return spdlog::level::debug;
	case dpp::ll_info:
		return spdlog::level::info;
	case dpp::ll_warning:
		return spdlog::level::warn;
	case dpp::ll_error:
		return spdlog::level::err;
	case dpp::ll_critical:
		return spdlog::level::critical;
	}
	return spdlog::level::info;
}

} // namespace

int main(int argc, char *argv[])
{
	const std::filesystem::path config_path = argc > 1 ? std::filesystem::path{argv[1]} : std::filesystem::path{constants::files::config_file};

	auto cfg = bot_config::load(config_path);
	if (!cfg) {
		std::cerr << "Config error: " << cfg.error().what() << "\n";
		return 1;
	}

	auto log = spdlog::stdout_color_mt(std::string{constants::store::logger_name});
	log->set_level(cfg->log_level);
	spdlog::set_default_logger(log);

	// Initialize services
	auto persistence = std::make_shared<persistence_service>(cfg->tags_file);
	auto tag_svc = std::make_shared<tag_service>(persistence);

	// A tag file that exists but cannot be read must not become an empty store.
	if (auto res = tag_svc->load(); !res) {
		log->critical("Cannot load tags: {}", res.error().what());
		return 1;
	}
	log->info("Loaded {} tags in {} namespaces from {}", tag_svc->tag_count(), tag_svc->namespace_count(), persistence->path().string());

	// Create bot
	dpp::cluster bot(cfg->token, dpp::i_default_intents | dpp::i_message_content);

	auto users = std::make_shared<dpp_user_directory>(bot);
	auto cmd_handler = std::make_shared<command_handler>(tag_svc, users, cfg->command_prefix);

	// Wire events
	bot.on_log([log](const dpp::log_t &ev) { log->log(to_spdlog_level(ev.severity), "[dpp] {}", ev.message); });

	bot.on_slashcommand([cmd_handler, log](const dpp::slashcommand_t &ev) {
		try {
			cmd_handler->on_slash(ev);
		} catch (const std::exception &e) {
			log->error("Slash command failed: {}", e.what());
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_message_create([cmd_handler, log](const dpp::message_create_t &ev) {
		try {
			cmd_handler->on_message(ev);
		} catch (const std::exception &e) {
			log->error("Message command failed: {}", e.what());
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	const auto guild_id = cfg->guild_id;
	bot.on_ready([&bot, guild_id, log](const dpp::ready_t &ev) {
		log->info("Started as {}, serving {} guilds", bot.me.format_username(), ev.guild_count);

		if (!dpp::run_once<struct register_bot_commands>()) {
			return;
		}

		auto cmds = command_handler::commands(bot.me.id);
		if (guild_id) {
			bot.guild_bulk_command_create(cmds, dpp::snowflake{*guild_id});
		}
		else {
			bot.global_bulk_command_create(cmds);
		}
	});

	// Start bot
	bot.start(dpp::st_wait);

	return 0;
}
