#include "core/constants.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace tagkeeper::util {

namespace {

// Reads exactly `width` digits starting at `pos`.
auto read_digits(std::string_view text, std::size_t pos, std::size_t width) -> std::optional<int>
{
	if (pos + width > text.size()) {
		return std::nullopt;
	}

	// from_chars would take a leading '-'
	if (!std::ranges::all_of(text.substr(pos, width), [](unsigned char c) { return std::isdigit(c) != 0; })) {
		return std::nullopt;
	}

	int value{};
	const auto *first = text.data() + pos;
	const auto *last = first + width;
	auto [ptr, ec] = std::from_chars(first, last, value);
	if (ec != std::errc{} || ptr != last) {
		return std::nullopt;
	}
	return value;
}

} // namespace

auto trim(std::string_view s) -> std::string_view
{
	auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

	while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
		s.remove_prefix(1);
	}
	while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
		s.remove_suffix(1);
	}
	return s;
}

auto normalize_name(std::string_view name) -> std::string
{
	std::string out{trim(name)};
	std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

auto format_iso8601(type::timestamp tp) -> std::string { return std::format("{:%Y-%m-%dT%H:%M:%S}Z", tp); }

auto parse_iso8601(std::string_view text) -> std::optional<type::timestamp>
{
	// YYYY-MM-DDTHH:MM:SS
	if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't' && text[10] != ' ') || text[13] != ':' ||
			text[16] != ':') {
		return std::nullopt;
	}

	auto year = read_digits(text, 0, 4);
	auto month = read_digits(text, 5, 2);
	auto day = read_digits(text, 8, 2);
	auto hour = read_digits(text, 11, 2);
	auto minute = read_digits(text, 14, 2);
	auto second = read_digits(text, 17, 2);
	if (!year || !month || !day || !hour || !minute || !second) {
		return std::nullopt;
	}

	const std::chrono::year_month_day ymd{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
																				std::chrono::day{static_cast<unsigned>(*day)}};
	if (!ymd.ok() || *hour > 23 || *minute > 59 || *second > 60) {
		return std::nullopt;
	}

	std::size_t pos = 19;

	// fractional seconds are dropped
	if (pos < text.size() && text[pos] == '.') {
		++pos;
		const auto digits_start = pos;
		while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
			++pos;
		}
		if (pos == digits_start) {
			return std::nullopt;
		}
	}

	std::chrono::seconds offset{0};
	if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
		++pos;
	}
	else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
		const int sign = text[pos] == '-' ? -1 : 1;
		auto off_h = read_digits(text, pos + 1, 2);
		auto off_m = read_digits(text, pos + 4, 2);
		if (!off_h || !off_m || pos + 3 >= text.size() || text[pos + 3] != ':' || *off_h > 23 || *off_m > 59) {
			return std::nullopt;
		}
		offset = sign * (std::chrono::hours{*off_h} + std::chrono::minutes{*off_m});
		pos += 6;
	}
	else {
		return std::nullopt;
	}

	if (pos != text.size()) {
		return std::nullopt;
	}

	auto local = std::chrono::sys_days{ymd} + std::chrono::hours{*hour} + std::chrono::minutes{*minute} + std::chrono::seconds{*second};
	return type::timestamp{local - offset};
}

auto logger() -> std::shared_ptr<spdlog::logger>
{
	if (auto named = spdlog::get(std::string{constants::store::logger_name})) {
		return named;
	}
	return spdlog::default_logger();
}

} // namespace tagkeeper::util
