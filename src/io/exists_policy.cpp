#include "io/exists_policy.hpp"

#include "io/errors.hpp"

#include <array>
#include <fmt/core.h>
#include <ranges>

namespace ranges = std::ranges;

namespace pathkit
{
	namespace
	{
		struct FlagName
		{
			ExistsFlag flag;
			std::string_view name;
		};
		// clang-format off
		constexpr auto flagNames = std::to_array<FlagName> ({
			{ExistsFlag::DirectoryFail,        "DirectoryFail"},
			{ExistsFlag::DirectoryMerge,       "DirectoryMerge"},
			{ExistsFlag::FileFail,             "FileFail"},
			{ExistsFlag::FileSkip,             "FileSkip"},
			{ExistsFlag::FileOverwrite,        "FileOverwrite"},
			{ExistsFlag::FileOverwriteIfNewer, "FileOverwriteIfNewer"}
		});

		struct PresetName
		{
			std::string_view name;
			ExistsPolicy policy;
		};
		constexpr auto presetNames = std::to_array<PresetName> ({
			{"fail",                     policies::Fail},
			{"merge-skip",               policies::MergeAndSkip},
			{"merge-overwrite",          policies::MergeAndOverwrite},
			{"merge-overwrite-if-newer", policies::MergeAndOverwriteIfNewer}
		});
		// clang-format on

		[[nodiscard]]
		auto singleFlagOn(ExistsPolicy policy, ExistsPolicy axis, std::string_view axisName)
			-> ExistsFlag
		{
			const auto selected = policy & axis;
			if (selected.size() != 1) {
				throw InvalidConfigurationError(
					fmt::format("Exactly one {} policy must be set, got '{}'", axisName, describe(policy)));
			}
			return *selected.begin();
		}
	} // namespace

	auto decideFileConflict(ExistsPolicy policy,
							std::string_view target,
							fs::file_time_type sourceWriteTime,
							fs::file_time_type targetWriteTime)
		-> ConflictDecision
	{
		switch (singleFlagOn(policy, policies::FileAxis, "file")) {
		case ExistsFlag::FileFail:
			throw AlreadyExistsError(fmt::format("File '{}' already exists", target));
		case ExistsFlag::FileSkip:
			return ConflictDecision::Skip;
		case ExistsFlag::FileOverwrite:
			return ConflictDecision::Proceed;
		case ExistsFlag::FileOverwriteIfNewer:
			return targetWriteTime < sourceWriteTime ? ConflictDecision::Proceed
													 : ConflictDecision::Skip;
		default:
			break;
		}
		throw InvalidConfigurationError(fmt::format("Unexpected file policy '{}'", describe(policy)));
	}

	void checkFilePolicy(ExistsPolicy policy)
	{
		static_cast<void>(singleFlagOn(policy, policies::FileAxis, "file"));
	}

	void checkDirectoryConflict(ExistsPolicy policy, std::string_view target, bool targetExists)
	{
		const auto flag = singleFlagOn(policy, policies::DirectoryAxis, "directory");
		if (targetExists && flag != ExistsFlag::DirectoryMerge) {
			throw AlreadyExistsError(
				fmt::format("Directory '{}' already exists and the policy disallows merging", target));
		}
	}

	auto flagName(ExistsFlag flag) noexcept -> std::string_view
	{
		auto findFlag = [flag](const auto &lookup) -> bool { return lookup.flag == flag; };

		if (const auto it = ranges::find_if(flagNames, findFlag); it != flagNames.end()) {
			return it->name;
		}
		return "Unknown";
	}

	auto describe(ExistsPolicy policy) -> std::string
	{
		if (policy.empty()) {
			return "None";
		}
		auto result = std::string{};
		for (const auto flag : policy) {
			if (!result.empty()) {
				result += '|';
			}
			result += flagName(flag);
		}
		return result;
	}

	auto policyByName(std::string_view name) noexcept -> std::optional<ExistsPolicy>
	{
		auto findName = [name](const auto &lookup) -> bool { return lookup.name == name; };

		if (const auto it = ranges::find_if(presetNames, findName); it != presetNames.end()) {
			return it->policy;
		}
		return std::nullopt;
	}
} // namespace pathkit
