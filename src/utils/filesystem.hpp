#pragma once

#include "utils/enum_set.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

/*----------------------------------------------------------------------------
--  Host file-system primitives
----------------------------------------------------------------------------*/
namespace fs_utils
{
	using Bytes = std::vector<std::uint8_t>;

	// Host-independent view of the entry attributes that listings can filter on.
	enum class Attribute : uint8_t { ReadOnly, Hidden, Executable, Symlink, Count };
	using Attributes = enum_set<Attribute>;

	enum class EntryKind { File, Directory };

	[[nodiscard]]
	inline auto normalize(const fs::path &path)
		-> fs::path
	{
		auto result = path.lexically_normal();
		if (result.native().ends_with(fs::path::preferred_separator) && result != result.root_path()) {
			return result.parent_path();
		}
		return result;
	}

	// True when 'path' is 'root' itself or lies beneath it, compared lexically.
	[[nodiscard]]
	inline bool startsWith(const fs::path &path, const fs::path &root)
	{
		if (root.empty()) {
			return false;
		}
		const auto rootNorm = normalize(fs::absolute(root));
		const auto pathNorm = normalize(fs::absolute(path));
		const auto [rootEnd, _] = std::ranges::mismatch(rootNorm, pathNorm);
		return rootEnd == rootNorm.end();
	}

	// Shell-style wildcard match ('*', '?', '[...]') of a single file name.
	[[nodiscard]]
	bool matchesWildcard(std::string_view name, std::string_view pattern);

	[[nodiscard]]
	auto attributesOf(const fs::path &path) -> Attributes;

	// Immediate children of 'dir' of the given kind whose names match 'pattern' and which
	// carry every attribute in 'filter'. Unsorted.
	[[nodiscard]]
	auto listEntries(const fs::path &dir,
					 EntryKind kind,
					 std::string_view pattern = "*",
					 Attributes filter = {})
		-> std::vector<fs::path>;

	[[nodiscard]]
	bool anyEntry(const fs::path &dir, EntryKind kind, std::string_view pattern, bool recursive);

	void clearReadOnly(const fs::path &path);
	void clearReadOnlyRecursive(const fs::path &dir);

	[[nodiscard]]
	auto readBytes(const fs::path &path) -> Bytes;

	void writeBytes(const fs::path &path, const Bytes &data, bool append = false);

	// Renames, falling back to copy and delete when the target lives on another device.
	void moveFile(const fs::path &source, const fs::path &target);
} // namespace fs_utils
