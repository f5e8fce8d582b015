#include "services/tag_service.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>

#include <format>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>

using namespace tagkeeper;

namespace {

constexpr std::uint64_t kAlice = 1;
constexpr std::uint64_t kBob = 2;
constexpr type::guild_context kDirect = std::nullopt;
constexpr type::guild_context kGuild = 1038042178439614505ULL;
constexpr type::guild_context kOtherGuild = 42ULL;

} // namespace

class TagServiceTest : public ::testing::Test {
protected:
	test::temp_dir dir;
	std::filesystem::path file = dir / "tags.json";
	std::shared_ptr<persistence_service> persistence = std::make_shared<persistence_service>(file);
	std::shared_ptr<tag_service> tags = std::make_shared<tag_service>(persistence);

	void SetUp() override
	{
		auto res = tags->load();
		ASSERT_TRUE(res) << res.error().what();
	}

	// A second store reading what the first one wrote.
	[[nodiscard]] auto reopen() const -> std::shared_ptr<tag_service>
	{
		auto other = std::make_shared<tag_service>(std::make_shared<persistence_service>(file));
		auto res = other->load();
		EXPECT_TRUE(res) << res.error().what();
		return other;
	}
};

TEST_F(TagServiceTest, CreateThenGetReturnsFreshRecord)
{
	auto created = tags->create_tag(kGuild, "welcome", "Hi!", kAlice);
	ASSERT_TRUE(created) << created.error().what();

	auto got = tags->get_tag(kGuild, "welcome");
	ASSERT_TRUE(got);
	EXPECT_EQ(got->name, "welcome");
	EXPECT_EQ(got->content, "Hi!");
	EXPECT_EQ(got->owner_id, kAlice);
	EXPECT_EQ(got->uses, 0u);
	EXPECT_EQ(got->location, std::optional<std::string>{"1038042178439614505"});
	EXPECT_EQ(*got, *created);
}

TEST_F(TagServiceTest, CreateWritesFileBeforeReturning)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "welcome", "Hi!", kAlice));
	EXPECT_TRUE(std::filesystem::exists(file));
	EXPECT_TRUE(reopen()->get_tag(kDirect, "welcome"));
}

TEST_F(TagServiceTest, NamesAreCaseInsensitive)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "Welcome", "Hi!", kAlice));

	auto got = tags->get_tag(kDirect, "WELCOME");
	ASSERT_TRUE(got);
	EXPECT_EQ(got->name, "welcome");
}

TEST_F(TagServiceTest, DuplicateCreateFailsAndKeepsOriginal)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "welcome", "Hi!", kAlice));

	auto dup = tags->create_tag(kGuild, "welcome", "Overwritten", kBob);
	ASSERT_FALSE(dup);
	EXPECT_TRUE(dup.error().is(type::error_code::duplicate));

	auto again = tags->create_tag(kGuild, "welcome", "Overwritten", kBob);
	ASSERT_FALSE(again);
	EXPECT_TRUE(again.error().is(type::error_code::duplicate));

	auto got = tags->get_tag(kGuild, "welcome");
	ASSERT_TRUE(got);
	EXPECT_EQ(got->content, "Hi!");
	EXPECT_EQ(got->owner_id, kAlice);
}

TEST_F(TagServiceTest, SameNameMayExistInEveryNamespace)
{
	EXPECT_TRUE(tags->create_tag(kDirect, "rules", "generic rules", kAlice));
	EXPECT_TRUE(tags->create_tag(kGuild, "rules", "guild rules", kAlice));
	EXPECT_TRUE(tags->create_tag(kOtherGuild, "rules", "other rules", kBob));

	EXPECT_EQ(tags->namespace_count(), 3u);
	EXPECT_EQ(tags->tag_count(), 3u);
}

TEST_F(TagServiceTest, InvalidCreateChangesNothing)
{
	auto blocked = tags->create_tag(kDirect, "@everyone-ping", "boo", kAlice);
	ASSERT_FALSE(blocked);
	EXPECT_TRUE(blocked.error().is(type::error_code::validation));

	auto too_long = tags->create_tag(kDirect, std::string(101, 'x'), "boo", kAlice);
	ASSERT_FALSE(too_long);
	EXPECT_TRUE(too_long.error().is(type::error_code::validation));

	auto empty = tags->create_tag(kDirect, "quiet", "   ", kAlice);
	ASSERT_FALSE(empty);
	EXPECT_TRUE(empty.error().is(type::error_code::validation));

	EXPECT_EQ(tags->tag_count(), 0u);
	EXPECT_FALSE(std::filesystem::exists(file)) << "failed validation must not trigger a save";
}

TEST_F(TagServiceTest, GuildTagOverridesGeneric)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "rules", "generic rules", kAlice));
	ASSERT_TRUE(tags->create_tag(kGuild, "rules", "guild rules", kBob));

	auto visible = tags->resolve_visible_tags(kGuild);
	ASSERT_EQ(visible.size(), 1u);
	EXPECT_EQ(visible.at("rules").content, "guild rules");

	EXPECT_EQ(tags->get_tag(kGuild, "rules")->content, "guild rules");
	EXPECT_EQ(tags->get_tag(kDirect, "rules")->content, "generic rules");
	EXPECT_EQ(tags->get_tag(kOtherGuild, "rules")->content, "generic rules");
}

TEST_F(TagServiceTest, GuildTagsStayInTheirGuild)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "secret", "only here", kAlice));

	EXPECT_TRUE(tags->get_tag(kGuild, "secret"));

	auto from_dm = tags->get_tag(kDirect, "secret");
	ASSERT_FALSE(from_dm);
	EXPECT_TRUE(from_dm.error().is(type::error_code::not_found));

	EXPECT_FALSE(tags->get_tag(kOtherGuild, "secret"));
}

TEST_F(TagServiceTest, ListTagsIsSortedMergedView)
{
	EXPECT_TRUE(tags->list_tags(kGuild).empty());

	ASSERT_TRUE(tags->create_tag(kDirect, "zeta", "z", kAlice));
	ASSERT_TRUE(tags->create_tag(kDirect, "alpha", "a", kAlice));
	ASSERT_TRUE(tags->create_tag(kGuild, "alpha", "guild a", kAlice));
	ASSERT_TRUE(tags->create_tag(kGuild, "mid", "m", kAlice));
	ASSERT_TRUE(tags->create_tag(kOtherGuild, "hidden", "h", kAlice));

	EXPECT_EQ(tags->list_tags(kGuild), (std::vector<std::string>{"alpha", "mid", "zeta"}));
	EXPECT_EQ(tags->list_tags(kDirect), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(TagServiceTest, EditByOwnerKeepsIdentity)
{
	auto created = tags->create_tag(kGuild, "welcome", "Hi!", kAlice);
	ASSERT_TRUE(created);
	ASSERT_TRUE(tags->increment_use(kGuild, "welcome"));

	auto edited = tags->edit_tag(kGuild, "welcome", "Hello there!", kAlice);
	ASSERT_TRUE(edited) << edited.error().what();
	EXPECT_EQ(edited->content, "Hello there!");
	EXPECT_EQ(edited->name, created->name);
	EXPECT_EQ(edited->owner_id, created->owner_id);
	EXPECT_EQ(edited->created_at, created->created_at);
	EXPECT_EQ(edited->location, created->location);
	EXPECT_EQ(edited->uses, 1u);

	EXPECT_EQ(reopen()->get_tag(kGuild, "welcome")->content, "Hello there!");
}

TEST_F(TagServiceTest, EditAndDeleteByOthersAreRejected)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "welcome", "Hi!", kAlice));

	auto edit = tags->edit_tag(kGuild, "welcome", "hijacked", kBob);
	ASSERT_FALSE(edit);
	EXPECT_TRUE(edit.error().is(type::error_code::permission));

	auto del = tags->delete_tag(kGuild, "welcome", kBob);
	ASSERT_FALSE(del);
	EXPECT_TRUE(del.error().is(type::error_code::permission));

	auto got = tags->get_tag(kGuild, "welcome");
	ASSERT_TRUE(got);
	EXPECT_EQ(got->content, "Hi!");
}

TEST_F(TagServiceTest, EditWithEmptyContentIsRejected)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "welcome", "Hi!", kAlice));

	auto edit = tags->edit_tag(kGuild, "welcome", "", kAlice);
	ASSERT_FALSE(edit);
	EXPECT_TRUE(edit.error().is(type::error_code::validation));
	EXPECT_EQ(tags->get_tag(kGuild, "welcome")->content, "Hi!");
}

TEST_F(TagServiceTest, MissingTagsAreNotFound)
{
	EXPECT_TRUE(tags->get_tag(kGuild, "nope").error().is(type::error_code::not_found));
	EXPECT_TRUE(tags->edit_tag(kGuild, "nope", "x", kAlice).error().is(type::error_code::not_found));
	EXPECT_TRUE(tags->delete_tag(kGuild, "nope", kAlice).error().is(type::error_code::not_found));
	EXPECT_TRUE(tags->increment_use(kGuild, "nope").error().is(type::error_code::not_found));
}

TEST_F(TagServiceTest, GenericTagEditedFromGuildStaysGeneric)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "faq", "v1", kAlice));

	ASSERT_TRUE(tags->edit_tag(kGuild, "faq", "v2", kAlice));
	ASSERT_TRUE(tags->increment_use(kGuild, "faq"));

	auto from_dm = tags->get_tag(kDirect, "faq");
	ASSERT_TRUE(from_dm);
	EXPECT_EQ(from_dm->content, "v2");
	EXPECT_EQ(from_dm->uses, 1u);
	EXPECT_TRUE(from_dm->is_generic());
	EXPECT_EQ(tags->namespace_count(), 1u) << "no guild bucket should appear";

	ASSERT_TRUE(tags->delete_tag(kGuild, "faq", kAlice));
	EXPECT_FALSE(tags->get_tag(kDirect, "faq"));
}

TEST_F(TagServiceTest, DeleteRemovesOnlyTheGuildCopy)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "rules", "generic rules", kAlice));
	ASSERT_TRUE(tags->create_tag(kGuild, "rules", "guild rules", kBob));

	ASSERT_TRUE(tags->delete_tag(kGuild, "rules", kBob));

	EXPECT_EQ(tags->get_tag(kGuild, "rules")->content, "generic rules");
}

TEST_F(TagServiceTest, IncrementUseCountsExactly)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "welcome", "Hi!", kAlice));
	ASSERT_TRUE(tags->create_tag(kOtherGuild, "other", "x", kBob));

	constexpr int kTimes = 17;
	for (int i = 0; i < kTimes; ++i) {
		auto used = tags->increment_use(kGuild, "welcome");
		ASSERT_TRUE(used);
		EXPECT_EQ(used->uses, static_cast<std::uint32_t>(i + 1));
		ASSERT_TRUE(tags->edit_tag(kOtherGuild, "other", std::format("edit {}", i), kBob));
	}

	EXPECT_EQ(tags->get_tag(kGuild, "welcome")->uses, static_cast<std::uint32_t>(kTimes));
	EXPECT_EQ(reopen()->get_tag(kGuild, "welcome")->uses, static_cast<std::uint32_t>(kTimes));
}

TEST_F(TagServiceTest, ConcurrentUsesAreNotLost)
{
	ASSERT_TRUE(tags->create_tag(kGuild, "welcome", "Hi!", kAlice));

	constexpr int kThreads = 8;
	constexpr int kPerThread = 25;

	std::vector<std::thread> workers;
	for (int t = 0; t < kThreads; ++t) {
		workers.emplace_back([this, t] {
			for (int i = 0; i < kPerThread; ++i) {
				EXPECT_TRUE(tags->increment_use(kGuild, "welcome"));
				// unrelated writers in other namespaces
				EXPECT_TRUE(tags->create_tag(kOtherGuild, std::format("t{}-{}", t, i), "x", kBob));
			}
		});
	}
	for (auto &w : workers) {
		w.join();
	}

	EXPECT_EQ(tags->get_tag(kGuild, "welcome")->uses, static_cast<std::uint32_t>(kThreads * kPerThread));
	EXPECT_EQ(tags->list_tags(kOtherGuild).size(), static_cast<std::size_t>(kThreads * kPerThread));

	auto reloaded = reopen();
	EXPECT_EQ(reloaded->get_tag(kGuild, "welcome")->uses, static_cast<std::uint32_t>(kThreads * kPerThread));
	EXPECT_EQ(reloaded->tag_count(), static_cast<std::size_t>(kThreads * kPerThread + 1));
}

TEST_F(TagServiceTest, WelcomeTagLifecycle)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "welcome", "Hi!", kAlice));
	EXPECT_EQ(tags->list_tags(kDirect), (std::vector<std::string>{"welcome"}));

	auto got = tags->get_tag(kDirect, "welcome");
	ASSERT_TRUE(got);
	EXPECT_EQ(got->content, "Hi!");
	EXPECT_EQ(got->uses, 0u);

	auto used = tags->increment_use(kDirect, "welcome");
	ASSERT_TRUE(used);
	EXPECT_EQ(used->uses, 1u);

	auto denied = tags->delete_tag(kDirect, "welcome", kBob);
	ASSERT_FALSE(denied);
	EXPECT_TRUE(denied.error().is(type::error_code::permission));

	EXPECT_TRUE(tags->delete_tag(kDirect, "welcome", kAlice));
	EXPECT_TRUE(tags->list_tags(kDirect).empty());
}

TEST_F(TagServiceTest, ReloadReproducesEveryNamespace)
{
	ASSERT_TRUE(tags->create_tag(kDirect, "welcome", "Hi!", kAlice));
	ASSERT_TRUE(tags->create_tag(kGuild, "rules", "Be nice", kBob));
	ASSERT_TRUE(tags->create_tag(kOtherGuild, "gone", "bye", kBob));
	ASSERT_TRUE(tags->increment_use(kGuild, "rules"));
	ASSERT_TRUE(tags->edit_tag(kDirect, "welcome", "Hello!", kAlice));
	ASSERT_TRUE(tags->delete_tag(kOtherGuild, "gone", kBob));

	auto reloaded = reopen();
	EXPECT_EQ(reloaded->namespace_count(), tags->namespace_count());
	EXPECT_EQ(reloaded->tag_count(), tags->tag_count());
	for (auto guild : {kDirect, kGuild, kOtherGuild}) {
		EXPECT_EQ(reloaded->resolve_visible_tags(guild), tags->resolve_visible_tags(guild));
	}
}

TEST_F(TagServiceTest, FailedSaveIsReportedButMutationStays)
{
	auto broken = std::make_shared<tag_service>(std::make_shared<persistence_service>(dir / "missing" / "tags.json"));
	ASSERT_TRUE(broken->load());

	auto res = broken->create_tag(kDirect, "welcome", "Hi!", kAlice);
	ASSERT_FALSE(res);
	EXPECT_TRUE(res.error().is(type::error_code::io));

	// applied in memory, just not durable
	EXPECT_TRUE(broken->get_tag(kDirect, "welcome"));

	std::filesystem::create_directories(dir / "missing");
	ASSERT_TRUE(broken->increment_use(kDirect, "welcome"));
	EXPECT_TRUE(std::filesystem::exists(dir / "missing" / "tags.json"));
}

TEST_F(TagServiceTest, UseCountSaturatesAtItsMaximum)
{
	{
		std::ofstream out(file);
		out << R"({"generic": {"busy": {"name": "busy", "content": "x", "owner_id": 1, "uses": 4294967294}}})";
	}

	auto fresh = std::make_shared<tag_service>(std::make_shared<persistence_service>(file));
	ASSERT_TRUE(fresh->load());

	constexpr auto kMax = std::numeric_limits<std::uint32_t>::max();
	for (int i = 0; i < 3; ++i) {
		auto used = fresh->increment_use(kGuild, "busy");
		ASSERT_TRUE(used) << used.error().what();
		EXPECT_EQ(used->uses, kMax);
	}
	EXPECT_EQ(reopen()->get_tag(kDirect, "busy")->uses, kMax);
}

TEST_F(TagServiceTest, CorruptFileFailsLoad)
{
	{
		std::ofstream out(file);
		out << "not json at all";
	}

	auto fresh = std::make_shared<tag_service>(std::make_shared<persistence_service>(file));
	auto res = fresh->load();
	ASSERT_FALSE(res);
	EXPECT_TRUE(res.error().is(type::error_code::corrupt));
}

TEST(TagServiceStaticTest, TargetNamespace)
{
	EXPECT_EQ(tag_service::target_namespace(std::nullopt), "generic");
	EXPECT_EQ(tag_service::target_namespace(123u), "123");
}
