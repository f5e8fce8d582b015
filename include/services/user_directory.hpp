#pragma once

#include "core/utils.hpp"
#include <dpp/dpp.h>

#include <cstdint>
#include <optional>
#include <string>

namespace tagkeeper {

struct user_profile {
	std::string name;
	std::string avatar_url; // empty when the user has none
};

// Resolves a tag owner to something displayable. Lookups may fail; callers render without it.
class user_directory {
public:
	virtual ~user_directory() = default;

	[[nodiscard]] virtual auto find(std::uint64_t user_id) -> std::optional<user_profile> = 0;
};

// User cache first, REST API second.
class dpp_user_directory final : public user_directory {
public:
	explicit dpp_user_directory(dpp::cluster &bot) : bot_(bot) {}

	[[nodiscard]] auto find(std::uint64_t user_id) -> std::optional<user_profile> override;

private:
	dpp::cluster &bot_;

	[[nodiscard]] static auto to_profile(const dpp::user &u) -> user_profile;
};

} // namespace tagkeeper
