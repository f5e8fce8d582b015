#include "core/constants.hpp"
#include "handlers/tag_command.hpp"

#include <cctype>
#include <ranges>

namespace tagkeeper {

namespace {

auto join_content(std::span<const std::string> words) -> std::string
{
	std::string out;
	for (const auto &w : words) {
		if (!out.empty()) {
			out += ' ';
		}
		out += w;
	}
	return out;
}

// <name> <content...>
template <typename Cmd>
auto parse_name_and_content(std::span<const std::string> rest) -> std::expected<tag_command, type::error>
{
	if (rest.empty()) {
		return std::unexpected(type::error{constants::text::missing_name, type::error_code::validation});
	}

	auto content = join_content(rest.subspan(1));
	if (content.empty()) {
		return std::unexpected(type::error{constants::text::missing_content, type::error_code::validation});
	}

	return Cmd{.name = util::normalize_name(rest.front()), .content = std::move(content)};
}

template <typename Cmd>
auto parse_name_only(std::span<const std::string> rest) -> std::expected<tag_command, type::error>
{
	if (rest.empty()) {
		return std::unexpected(type::error{constants::text::missing_name, type::error_code::validation});
	}
	return Cmd{.name = util::normalize_name(rest.front())};
}

} // namespace

auto split_args(std::string_view text) -> std::vector<std::string>
{
	std::vector<std::string> out;
	auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

	std::size_t i = 0;
	while (i < text.size()) {
		while (i < text.size() && is_space(text[i])) {
			++i;
		}
		const auto start = i;
		while (i < text.size() && !is_space(text[i])) {
			++i;
		}
		if (i > start) {
			out.emplace_back(text.substr(start, i - start));
		}
	}

	return out;
}

auto parse_tag_command(std::span<const std::string> args) -> std::expected<tag_command, type::error>
{
	if (args.empty()) {
		return std::unexpected(type::error{constants::text::usage, type::error_code::validation});
	}

	const auto &sub = args.front();
	const auto rest = args.subspan(1);

	if (sub == "create")
		return parse_name_and_content<create_cmd>(rest);
	if (sub == "info")
		return parse_name_only<info_cmd>(rest);
	if (sub == "list")
		return list_cmd{};
	if (sub == "edit")
		return parse_name_and_content<edit_cmd>(rest);
	if (sub == "delete")
		return parse_name_only<delete_cmd>(rest);

	return invoke_cmd{.name = util::normalize_name(sub)};
}

} // namespace tagkeeper
