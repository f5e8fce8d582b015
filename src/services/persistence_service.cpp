#include "services/persistence_service.hpp"
#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <random>
#include <system_error>

namespace tagkeeper {

auto persistence_service::generate_suffix() -> std::string
{
	thread_local std::mt19937_64 rng{std::random_device{}()};
	std::uniform_int_distribution<std::uint64_t> dist;
	return std::format("{:016x}", dist(rng));
}

auto persistence_service::temp_path() const -> std::filesystem::path
{
	// Same directory as the target so the rename never crosses filesystems.
	auto name = std::format(".{}.{}{}", tags_path_.filename().string(), generate_suffix(), constants::files::temp_suffix);
	return tags_path_.parent_path() / name;
}

auto persistence_service::load_tags() const -> std::expected<namespace_map, type::error>
{
	namespace_map tags;

	std::error_code ec;
	if (!std::filesystem::exists(tags_path_, ec)) {
		if (ec) {
			return std::unexpected(type::error{std::format("Cannot access {}: {}", tags_path_.string(), ec.message()), type::error_code::corrupt});
		}
		util::logger()->info("No tag file at {}, starting with an empty store", tags_path_.string());
		return tags; // first run
	}

	std::ifstream file(tags_path_, std::ios::binary);
	if (!file) {
		return std::unexpected(type::error{std::format("Cannot open {}", tags_path_.string()), type::error_code::corrupt});
	}

	try { // The try block is for nlohmann::json
		// parse() rejects trailing content after the root value, operator>> does not
		auto j = nlohmann::json::parse(file);

		if (!j.is_object()) {
			return std::unexpected(type::error{std::format("{}: root is not an object", tags_path_.string()), type::error_code::corrupt});
		}

		std::size_t count = 0;
		for (const auto &[ns, bucket_json] : j.items()) {
			if (!bucket_json.is_object()) {
				return std::unexpected(type::error{std::format("{}: namespace '{}' is not an object", tags_path_.string(), ns), type::error_code::corrupt});
			}

			auto &bucket = tags[ns];
			const bool generic = ns == constants::store::generic_namespace;
			for (const auto &[name, tag_json] : bucket_json.items()) {
				auto t = tag::from_json(tag_json);
				// the bucket decides where a record lives
				t.location = generic ? std::nullopt : std::optional<std::string>{ns};
				bucket.insert_or_assign(name, std::move(t));
				++count;
			}
		}

		util::logger()->debug("Loaded {} tags in {} namespaces from {}", count, tags.size(), tags_path_.string());
		return tags;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Failed to parse {}: {}", tags_path_.string(), e.what()), type::error_code::corrupt});
	}
}

auto persistence_service::save_tags(const namespace_map &tags) const -> type::result
{
	std::string data;
	try { // The try block is for nlohmann::json
		nlohmann::json j = nlohmann::json::object();
		for (const auto &[ns, bucket] : tags) {
			auto &bj = j[ns];
			bj = nlohmann::json::object();
			for (const auto &[name, t] : bucket) {
				bj[name] = t.to_json();
			}
		}
		data = j.dump(2);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Failed to serialize tags: {}", e.what()), type::error_code::io});
	}

	const auto tmp = temp_path();
	std::error_code ec;

	{
		std::ofstream out{tmp, std::ios::trunc | std::ios::binary};
		if (!out) {
			util::logger()->error("Cannot create temp file {}", tmp.string());
			return std::unexpected(type::error{std::format("Cannot create {}", tmp.string()), type::error_code::io});
		}

		out.write(data.data(), static_cast<std::streamsize>(data.size()));
		out.flush();

		if (!out) {
			out.close();
			std::filesystem::remove(tmp, ec);
			util::logger()->error("Write failed: {}", tmp.string());
			return std::unexpected(type::error{std::format("Write to {} failed", tmp.string()), type::error_code::io});
		}
	}

	// Readers see either the old file or the new one, never a partial write.
	std::filesystem::rename(tmp, tags_path_, ec);
	if (ec) {
		auto msg = std::format("Rename {} -> {} failed: {}", tmp.string(), tags_path_.string(), ec.message());
		util::logger()->error("{}", msg);
		std::error_code rm_ec;
		std::filesystem::remove(tmp, rm_ec);
		return std::unexpected(type::error{msg, type::error_code::io});
	}

	util::logger()->trace("Saved {} namespaces to {}", tags.size(), tags_path_.string());
	return std::monostate{};
}

} // namespace tagkeeper
