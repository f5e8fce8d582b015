#pragma once

#include "core/utils.hpp"

#include <span>
#include <string>
#include <variant>
#include <vector>

namespace tagkeeper {

struct create_cmd {
	std::string name;
	std::string content;
};

struct info_cmd {
	std::string name;
};

struct list_cmd {};

struct edit_cmd {
	std::string name;
	std::string content;
};

struct delete_cmd {
	std::string name;
};

// `tag <name>`: print the content and count a use
struct invoke_cmd {
	std::string name;
};

using tag_command = std::variant<create_cmd, info_cmd, list_cmd, edit_cmd, delete_cmd, invoke_cmd>;

// Whitespace-separated words of a message body, quotes are not special.
[[nodiscard]] auto split_args(std::string_view text) -> std::vector<std::string>;

// args are the words after the command name: `create <name> <content...>`, `info <name>`,
// `list`, `edit <name> <content...>`, `delete <name>`, or `<name>`.
// Names come back trimmed and lowercased, content words joined by single spaces.
[[nodiscard]] auto parse_tag_command(std::span<const std::string> args) -> std::expected<tag_command, type::error>;

// helper type for the visitor
template <class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};

} // namespace tagkeeper
