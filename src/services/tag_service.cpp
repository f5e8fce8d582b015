#include "core/constants.hpp"
#include "services/tag_service.hpp"

#include <algorithm>
#include <limits>
#include <ranges>

namespace tagkeeper {

tag_service::tag_service(std::shared_ptr<persistence_service> persistence) : persistence_(std::move(persistence)) {}

auto tag_service::target_namespace(type::guild_context guild) -> std::string
{
	return guild ? std::to_string(*guild) : std::string{constants::store::generic_namespace};
}

auto tag_service::load() -> type::result
{
	std::lock_guard guard{mutex_};

	// The gcc has false positvies issue here, for more detail, see https://gcc.gnu.org/bugzilla/show_bug.cgi?id=107532
	if (auto res = persistence_->load_tags()) {
		tags_ = std::move(*res);
	}
	else {
		return std::unexpected(res.error());
	}

	return std::monostate{};
}

auto tag_service::persist_locked() const -> type::result
{
	if (auto res = persistence_->save_tags(tags_); !res) {
		return std::unexpected(type::error{res.error().what(), type::error_code::io});
	}
	return std::monostate{};
}

auto tag_service::resolve_locked(type::guild_context guild) const -> tag_bucket
{
	tag_bucket out;

	if (auto it = tags_.find(std::string{constants::store::generic_namespace}); it != tags_.end()) {
		out = it->second;
	}

	if (guild) {
		if (auto it = tags_.find(target_namespace(guild)); it != tags_.end()) {
			for (const auto &[name, t] : it->second) {
				out.insert_or_assign(name, t); // guild overrides generic
			}
		}
	}

	return out;
}

auto tag_service::find_bucket_locked(type::guild_context guild, const std::string &name) -> tag_bucket *
{
	// Same precedence as resolve_locked, but pointing at the stored bucket.
	if (guild) {
		if (auto ns = tags_.find(target_namespace(guild)); ns != tags_.end() && ns->second.contains(name)) {
			return &ns->second;
		}
	}

	if (auto ns = tags_.find(std::string{constants::store::generic_namespace}); ns != tags_.end() && ns->second.contains(name)) {
		return &ns->second;
	}

	return nullptr;
}

auto tag_service::resolve_visible_tags(type::guild_context guild) const -> tag_bucket
{
	std::lock_guard guard{mutex_};
	return resolve_locked(guild);
}

auto tag_service::get_tag(type::guild_context guild, std::string_view name) const -> std::expected<tag, type::error>
{
	const auto key = util::normalize_name(name);

	std::lock_guard guard{mutex_};
	auto visible = resolve_locked(guild);
	if (auto it = visible.find(key); it != visible.end()) {
		return it->second;
	}

	return std::unexpected(type::error{constants::text::tag_not_found, type::error_code::not_found});
}

auto tag_service::list_tags(type::guild_context guild) const -> std::vector<std::string>
{
	std::unique_lock guard{mutex_};
	auto visible = resolve_locked(guild);
	guard.unlock();

	auto names = std::ranges::to<std::vector<std::string>>(visible | std::views::keys);
	std::ranges::sort(names);
	return names;
}

auto tag_service::create_tag(type::guild_context guild, std::string_view name, std::string content, std::uint64_t owner_id)
		-> std::expected<tag, type::error>
{
	auto key = util::normalize_name(name);

	if (auto res = tag::validate_name(key); !res) {
		return std::unexpected(res.error());
	}

	if (auto res = tag::validate_content(content); !res) {
		return std::unexpected(res.error());
	}

	const auto location = target_namespace(guild);

	std::lock_guard guard{mutex_};

	// buckets are created lazily
	auto &bucket = tags_[location];
	if (bucket.contains(key)) {
		return std::unexpected(type::error{constants::text::tag_exists, type::error_code::duplicate});
	}

	tag t{.name = key,
				.content = std::move(content),
				.owner_id = owner_id,
				.uses = 0,
				.location = guild ? std::optional<std::string>{location} : std::nullopt,
				.created_at = util::now()};

	bucket.emplace(key, t);
	util::logger()->info("Tag '{}' created in {} by {}", key, location, owner_id);

	if (auto res = persist_locked(); !res) {
		return std::unexpected(res.error());
	}

	return t;
}

auto tag_service::edit_tag(type::guild_context guild, std::string_view name, std::string new_content, std::uint64_t requester_id)
		-> std::expected<tag, type::error>
{
	const auto key = util::normalize_name(name);

	std::lock_guard guard{mutex_};

	auto *bucket = find_bucket_locked(guild, key);
	if (bucket == nullptr) {
		return std::unexpected(type::error{constants::text::tag_not_found, type::error_code::not_found});
	}

	auto &t = bucket->at(key);
	if (t.owner_id != requester_id) {
		return std::unexpected(type::error{constants::text::no_permission, type::error_code::permission});
	}

	if (auto res = tag::validate_content(new_content); !res) {
		return std::unexpected(res.error());
	}

	// name, owner, location and created_at are left as they are
	t.content = std::move(new_content);
	util::logger()->info("Tag '{}' in {} edited by {}", key, t.namespace_key(), requester_id);

	auto updated = t;
	if (auto res = persist_locked(); !res) {
		return std::unexpected(res.error());
	}

	return updated;
}

auto tag_service::delete_tag(type::guild_context guild, std::string_view name, std::uint64_t requester_id) -> type::result
{
	const auto key = util::normalize_name(name);

	std::lock_guard guard{mutex_};

	auto *bucket = find_bucket_locked(guild, key);
	if (bucket == nullptr) {
		return std::unexpected(type::error{constants::text::tag_not_found, type::error_code::not_found});
	}

	if (bucket->at(key).owner_id != requester_id) {
		return std::unexpected(type::error{constants::text::no_permission, type::error_code::permission});
	}

	// The serving bucket may be "generic" even inside a guild.
	bucket->erase(key);
	util::logger()->info("Tag '{}' deleted by {}", key, requester_id);

	return persist_locked();
}

auto tag_service::increment_use(type::guild_context guild, std::string_view name) -> std::expected<tag, type::error>
{
	const auto key = util::normalize_name(name);

	std::lock_guard guard{mutex_};

	auto *bucket = find_bucket_locked(guild, key);
	if (bucket == nullptr) {
		return std::unexpected(type::error{constants::text::tag_not_found, type::error_code::not_found});
	}

	auto &t = bucket->at(key);
	// saturates instead of wrapping back to zero
	if (t.uses < std::numeric_limits<std::uint32_t>::max()) {
		++t.uses;
	}
	util::logger()->debug("Tag '{}' used ({} uses)", key, t.uses);

	auto used = t;
	if (auto res = persist_locked(); !res) {
		return std::unexpected(res.error());
	}

	return used;
}

auto tag_service::tag_count() const -> std::size_t
{
	std::lock_guard guard{mutex_};
	return std::ranges::fold_left(tags_ | std::views::values | std::views::transform([](const tag_bucket &b) { return b.size(); }), std::size_t{0},
																std::plus{});
}

auto tag_service::namespace_count() const -> std::size_t
{
	std::lock_guard guard{mutex_};
	return tags_.size();
}

} // namespace tagkeeper
