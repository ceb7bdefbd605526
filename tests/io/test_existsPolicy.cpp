#include <doctest/doctest.h>
#include "io/errors.hpp"
#include "io/exists_policy.hpp"

#include <chrono>

using namespace pathkit;
using namespace std::chrono_literals;

namespace
{
	const auto older = fs::file_time_type::clock::now() - 1h;
	const auto newer = fs::file_time_type::clock::now();

	auto decide(ExistsPolicy policy, fs::file_time_type source, fs::file_time_type target)
	{
		return decideFileConflict(policy, "/target", source, target);
	}
} // namespace

TEST_CASE("ExistsPolicy: presets") {
	CHECK(policies::Fail == ExistsPolicy{ExistsFlag::DirectoryFail, ExistsFlag::FileFail});
	CHECK(policies::MergeAndSkip.contains(ExistsFlag::DirectoryMerge));
	CHECK(policies::MergeAndSkip.contains(ExistsFlag::FileSkip));
	CHECK((policies::MergeAndOverwriteIfNewer & policies::FileAxis) == ExistsPolicy{ExistsFlag::FileOverwriteIfNewer});

	CHECK(describe(policies::MergeAndOverwrite) == "DirectoryMerge|FileOverwrite");
	CHECK(describe({}) == "None");

	CHECK(policyByName("merge-skip") == policies::MergeAndSkip);
	CHECK(policyByName("fail") == policies::Fail);
	CHECK_FALSE(policyByName("merge").has_value());
}

TEST_CASE("ExistsPolicy: file conflict table") {
	SUBCASE("fail") {
		CHECK_THROWS_AS(static_cast<void>(decide(policies::Fail, newer, older)), AlreadyExistsError);
	}
	SUBCASE("skip") {
		CHECK(decide(policies::MergeAndSkip, newer, older) == ConflictDecision::Skip);
		CHECK(decide(policies::MergeAndSkip, older, newer) == ConflictDecision::Skip);
	}
	SUBCASE("overwrite") {
		CHECK(decide(policies::MergeAndOverwrite, older, newer) == ConflictDecision::Proceed);
	}
	SUBCASE("overwrite if newer") {
		CHECK(decide(policies::MergeAndOverwriteIfNewer, newer, older) == ConflictDecision::Proceed);
		CHECK(decide(policies::MergeAndOverwriteIfNewer, older, newer) == ConflictDecision::Skip);
		CHECK(decide(policies::MergeAndOverwriteIfNewer, newer, newer) == ConflictDecision::Skip);
	}
	SUBCASE("exactly one file flag") {
		CHECK_THROWS_AS(static_cast<void>(decide(ExistsPolicy{ExistsFlag::DirectoryMerge}, newer, older)),
						InvalidConfigurationError);
		CHECK_THROWS_AS(static_cast<void>(decide(ExistsPolicy{ExistsFlag::FileSkip, ExistsFlag::FileOverwrite},
												 newer, older)),
						InvalidConfigurationError);
		CHECK_THROWS_AS(checkFilePolicy(ExistsPolicy{}), InvalidConfigurationError);
		CHECK_NOTHROW(checkFilePolicy(policies::MergeAndSkip));
	}
}

TEST_CASE("ExistsPolicy: directory conflicts") {
	CHECK_NOTHROW(checkDirectoryConflict(policies::Fail, "/dir", false));
	CHECK_THROWS_AS(checkDirectoryConflict(policies::Fail, "/dir", true), AlreadyExistsError);
	CHECK_NOTHROW(checkDirectoryConflict(policies::MergeAndSkip, "/dir", true));

	CHECK_THROWS_AS(checkDirectoryConflict(ExistsPolicy{ExistsFlag::FileSkip}, "/dir", false),
					InvalidConfigurationError);
	CHECK_THROWS_AS(checkDirectoryConflict(policies::DirectoryAxis, "/dir", false), InvalidConfigurationError);
}
