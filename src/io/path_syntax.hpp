#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/*----------------------------------------------------------------------------
--  String-level path syntax. Nothing here touches the file system.
----------------------------------------------------------------------------*/
namespace pathkit::syntax
{
	constexpr char kWindowsSeparator = '\\';
	constexpr char kUnixSeparator = '/';

	[[nodiscard]]
	constexpr char hostSeparator() noexcept
	{
		return static_cast<char>(std::filesystem::path::preferred_separator);
	}

	[[nodiscard]]
	constexpr bool isSeparator(char c) noexcept
	{
		return c == kWindowsSeparator || c == kUnixSeparator;
	}

	[[nodiscard]]
	constexpr bool isAsciiLetter(char c) noexcept
	{
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
	}

	[[nodiscard]]
	constexpr bool isWindowsRoot(std::string_view root) noexcept
	{
		return root.size() == 2 && isAsciiLetter(root[0]) && root[1] == ':';
	}

	[[nodiscard]]
	constexpr bool isUnixRoot(std::string_view root) noexcept
	{
		return root.size() == 1 && root[0] == kUnixSeparator;
	}

	[[nodiscard]]
	constexpr bool hasUnixRoot(std::string_view path) noexcept
	{
		return isUnixRoot(path.substr(0, 1));
	}

	[[nodiscard]]
	constexpr bool hasWindowsRoot(std::string_view path) noexcept
	{
		return isWindowsRoot(path.substr(0, 2));
	}

	[[nodiscard]]
	constexpr auto getRoot(std::string_view path) noexcept
		-> std::optional<std::string_view>
	{
		if (hasUnixRoot(path)) {
			return path.substr(0, 1);
		}
		if (hasWindowsRoot(path)) {
			return path.substr(0, 2);
		}
		return std::nullopt;
	}

	[[nodiscard]]
	constexpr bool hasRoot(std::string_view path) noexcept
	{
		return getRoot(path).has_value();
	}

	// Separator implied by the root of 'path', or the host one for unrooted paths.
	[[nodiscard]]
	constexpr char separatorOf(std::string_view path) noexcept
	{
		if (hasWindowsRoot(path)) {
			return kWindowsSeparator;
		}
		if (hasUnixRoot(path)) {
			return kUnixSeparator;
		}
		return hostSeparator();
	}

	// Rewrites 'path' with a single separator, dropping "." segments and cancelling
	// "name/.." pairs. Throws SeparatorConflictError when 'separator' does not suit the
	// root and RootBoundaryError when a ".." would climb above the root.
	[[nodiscard]]
	auto normalize(std::string_view path, std::optional<char> separator = std::nullopt)
		-> std::string;

	// Joins two fragments. The right-hand side must not be rooted (MalformedPathError).
	[[nodiscard]]
	auto combine(std::string_view left,
				 std::string_view right,
				 std::optional<char> separator = std::nullopt)
		-> std::string;

	// Path leading from 'basePath' to 'destinationPath', e.g. "../c/d". Both must share
	// the same root and separator.
	[[nodiscard]]
	auto relativeTo(std::string_view basePath, std::string_view destinationPath)
		-> std::string;

	[[nodiscard]]
	bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

	[[nodiscard]]
	bool endsWithIgnoreCase(std::string_view str, std::string_view suffix) noexcept;
} // namespace pathkit::syntax
