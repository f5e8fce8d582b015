#include "services/user_directory.hpp"

namespace tagkeeper {

auto dpp_user_directory::to_profile(const dpp::user &u) -> user_profile
{
	// Prefer global display name; otherwise use the account handle.
	return user_profile{.name = !u.global_name.empty() ? u.global_name : u.username, .avatar_url = u.get_avatar_url()};
}

auto dpp_user_directory::find(std::uint64_t user_id) -> std::optional<user_profile>
{
	if (auto *u = dpp::find_user(dpp::snowflake{user_id})) {
		return to_profile(*u);
	}

	try {
		auto fetched = bot_.user_get_cached_sync(dpp::snowflake{user_id});
		return to_profile(fetched);
	} catch (const dpp::exception &e) {
		util::logger()->debug("User lookup for {} failed: {}", user_id, e.what());
		return std::nullopt;
	}
}

} // namespace tagkeeper
