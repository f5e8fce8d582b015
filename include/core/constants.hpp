#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace tagkeeper::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "Unknown command.";
inline constexpr std::string_view usage = "Either specify a tag name or use one of the available commands.";
inline constexpr std::string_view missing_name = "Please specify a name for the tag.";
inline constexpr std::string_view missing_content = "Please specify some content for the tag.";
inline constexpr std::string_view name_empty = "Tag name must not be empty.";
inline constexpr std::string_view name_too_long = "Tag name limit is 100 characters.";
inline constexpr std::string_view name_blocked = "Tag contains blocked words.";
inline constexpr std::string_view tag_exists = "Tag already exists.";
inline constexpr std::string_view tag_not_found = "Tag not found.";
inline constexpr std::string_view no_permission = "You do not have permission to do that.";
inline constexpr std::string_view not_saved = "The change was applied but could not be written to disk. Please try again later.";
inline constexpr std::string_view no_tags = "No tags available.";
inline constexpr std::string_view available_tags = "Available tags: ";

inline constexpr std::string_view footer_generic = "Generic";
inline constexpr std::string_view footer_guild = "Server-specific";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
} // namespace text

// File paths
namespace files {
inline constexpr std::string_view tags_file = "tags.json";
inline constexpr std::string_view config_file = "config.json";
inline constexpr std::string_view token_file = ".bot_token";
inline constexpr std::string_view temp_suffix = ".tmp";
} // namespace files

// Store layout
namespace store {
inline constexpr std::string_view generic_namespace = "generic";
inline constexpr std::string_view logger_name = "tagkeeper";
} // namespace store

// Limits
namespace limits {
inline constexpr std::size_t max_tag_name_length = 100;
inline constexpr std::array<std::string_view, 2> blocked_name_words{"@everyone", "@here"};
} // namespace limits

} // namespace tagkeeper::constants
