#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/tag.hpp"

#include <filesystem>

namespace tagkeeper {

// Reads and atomically rewrites the whole namespace map as one JSON document.
// Not synchronized: the owning tag_service serializes every call.
class persistence_service {
public:
	explicit persistence_service(std::filesystem::path tags_path = constants::files::tags_file) : tags_path_{std::move(tags_path)} {}

	// Missing file yields an empty map. An unreadable or malformed file is an error_code::corrupt error.
	[[nodiscard]] auto load_tags() const -> std::expected<namespace_map, type::error>;

	// Writes to a uniquely named temp file beside the target, then renames it over the target.
	// On failure the previous file is left untouched and an error_code::io error is returned.
	[[nodiscard]] auto save_tags(const namespace_map &tags) const -> type::result;

	[[nodiscard]] auto path() const -> const std::filesystem::path & { return tags_path_; }

private:
	std::filesystem::path tags_path_;

	[[nodiscard]] auto temp_path() const -> std::filesystem::path;
	[[nodiscard]] static auto generate_suffix() -> std::string;
};

} // namespace tagkeeper
