#pragma once

#include "core/utils.hpp"
#include "models/tag.hpp"
#include "services/persistence_service.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tagkeeper {

/**
 * @brief
 * Owner of the namespace map. Every public call takes the same exclusive lock for the whole
 * read-validate-mutate-save sequence, so callers on different threads never see a torn state.
 * Mutations that fail validation or the ownership check change nothing and do not save.
 * A failed save returns an error_code::io error while the in-memory change stays applied.
 */
class tag_service {
public:
	explicit tag_service(std::shared_ptr<persistence_service> persistence);

	tag_service(const tag_service &) = delete;
	tag_service &operator=(const tag_service &) = delete;

	// Replaces the in-memory map with the persisted one; call once at startup.
	[[nodiscard]] auto load() -> type::result;

	// Generic tags merged with the guild's own; guild entries win on equal names.
	[[nodiscard]] auto resolve_visible_tags(type::guild_context guild) const -> tag_bucket;

	[[nodiscard]] auto get_tag(type::guild_context guild, std::string_view name) const -> std::expected<tag, type::error>;
	[[nodiscard]] auto list_tags(type::guild_context guild) const -> std::vector<std::string>;

	[[nodiscard]] auto create_tag(type::guild_context guild, std::string_view name, std::string content, std::uint64_t owner_id)
			-> std::expected<tag, type::error>;
	[[nodiscard]] auto edit_tag(type::guild_context guild, std::string_view name, std::string new_content, std::uint64_t requester_id)
			-> std::expected<tag, type::error>;
	[[nodiscard]] auto delete_tag(type::guild_context guild, std::string_view name, std::uint64_t requester_id) -> type::result;

	// Invocation path: bumps `uses` by one and saves.
	[[nodiscard]] auto increment_use(type::guild_context guild, std::string_view name) -> std::expected<tag, type::error>;

	[[nodiscard]] auto tag_count() const -> std::size_t;
	[[nodiscard]] auto namespace_count() const -> std::size_t;

	// Bucket key new tags go to: the guild id, or "generic" without a guild.
	[[nodiscard]] static auto target_namespace(type::guild_context guild) -> std::string;

private:
	std::shared_ptr<persistence_service> persistence_;

	mutable std::mutex mutex_;
	namespace_map tags_;

	// Callers must hold mutex_.
	[[nodiscard]] auto resolve_locked(type::guild_context guild) const -> tag_bucket;
	[[nodiscard]] auto find_bucket_locked(type::guild_context guild, const std::string &name) -> tag_bucket *;
	[[nodiscard]] auto persist_locked() const -> type::result;
};

} // namespace tagkeeper
