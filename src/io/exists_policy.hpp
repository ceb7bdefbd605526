#pragma once

#include "utils/enum_set.hpp"
#include "utils/filesystem.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pathkit
{
	// What move and copy do when their target already exists. One flag per axis.
	enum class ExistsFlag : uint8_t {
		DirectoryFail,
		DirectoryMerge,
		FileFail,
		FileSkip,
		FileOverwrite,
		FileOverwriteIfNewer,
		Count
	};
	using ExistsPolicy = enum_set<ExistsFlag>;

	namespace policies
	{
		// clang-format off
		constexpr auto DirectoryAxis = ExistsPolicy{ExistsFlag::DirectoryFail,
													ExistsFlag::DirectoryMerge};
		constexpr auto FileAxis      = ExistsPolicy{ExistsFlag::FileFail,
													ExistsFlag::FileSkip,
													ExistsFlag::FileOverwrite,
													ExistsFlag::FileOverwriteIfNewer};

		constexpr auto Fail                     = ExistsPolicy{ExistsFlag::DirectoryFail,  ExistsFlag::FileFail};
		constexpr auto MergeAndSkip             = ExistsPolicy{ExistsFlag::DirectoryMerge, ExistsFlag::FileSkip};
		constexpr auto MergeAndOverwrite        = ExistsPolicy{ExistsFlag::DirectoryMerge, ExistsFlag::FileOverwrite};
		constexpr auto MergeAndOverwriteIfNewer = ExistsPolicy{ExistsFlag::DirectoryMerge, ExistsFlag::FileOverwriteIfNewer};
		// clang-format on
	} // namespace policies

	enum class ConflictDecision { Proceed, Skip };

	// Decides a file conflict for an existing 'target'. Throws AlreadyExistsError for
	// FileFail and InvalidConfigurationError unless exactly one file flag is set.
	[[nodiscard]]
	auto decideFileConflict(ExistsPolicy policy,
							std::string_view target,
							fs::file_time_type sourceWriteTime,
							fs::file_time_type targetWriteTime)
		-> ConflictDecision;

	// Throws InvalidConfigurationError unless exactly one file flag is set.
	void checkFilePolicy(ExistsPolicy policy);

	// Throws unless exactly one directory flag is set, and AlreadyExistsError when the
	// target exists and merging is not allowed.
	void checkDirectoryConflict(ExistsPolicy policy, std::string_view target, bool targetExists);

	[[nodiscard]]
	auto flagName(ExistsFlag flag) noexcept -> std::string_view;

	// "DirectoryMerge|FileSkip" style rendering for diagnostics.
	[[nodiscard]]
	auto describe(ExistsPolicy policy) -> std::string;

	// Preset by its command line name: fail, merge-skip, merge-overwrite, merge-overwrite-if-newer.
	[[nodiscard]]
	auto policyByName(std::string_view name) noexcept -> std::optional<ExistsPolicy>;
} // namespace pathkit
