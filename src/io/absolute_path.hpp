#pragma once

#include "utils/filesystem.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pathkit
{
	class FileOps;
	class DirectoryOps;

	/*------------------------------------------------------------------------
	--  An immutable, rooted and normalized path.
	--
	--  Either Windows-rooted ("C:\dir\file") or Unix-rooted ("/dir/file"), with
	--  one separator throughout, no "." or ".." segments and no trailing
	--  separator except for a bare drive root ("C:\"). Comparisons ignore ASCII
	--  case for Windows-rooted paths.
	------------------------------------------------------------------------*/
	class AbsolutePath
	{
	public:
		// Throws MalformedPathError when 'path' has no root.
		explicit AbsolutePath(std::string_view path);

		[[nodiscard]]
		static auto tryParse(std::string_view path) -> std::optional<AbsolutePath>;

		[[nodiscard]]
		static auto fromNative(const fs::path &path) -> AbsolutePath;

		[[nodiscard]]
		const std::string &str() const noexcept { return value; }

		[[nodiscard]]
		auto native() const -> fs::path { return fs::path(value); }

		[[nodiscard]]
		bool isWindowsRooted() const noexcept;

		[[nodiscard]]
		bool isRoot() const noexcept;

		[[nodiscard]]
		auto name() const -> std::string;

		[[nodiscard]]
		auto parent() const -> std::optional<AbsolutePath>;

		// Appends a relative segment; throws MalformedPathError when it is rooted.
		[[nodiscard]]
		auto combine(std::string_view segment) const -> AbsolutePath;

		// Raw string concatenation, e.g. for appending an extension.
		[[nodiscard]]
		auto concat(std::string_view suffix) const -> AbsolutePath;

		[[nodiscard]]
		auto relativeTo(const AbsolutePath &base) const -> std::string;

		[[nodiscard]]
		auto file() const -> FileOps;

		[[nodiscard]]
		auto directory() const -> DirectoryOps;

		[[nodiscard]]
		auto operator/(std::string_view segment) const -> AbsolutePath { return combine(segment); }

		[[nodiscard]]
		auto operator+(std::string_view suffix) const -> AbsolutePath { return concat(suffix); }

		[[nodiscard]]
		bool operator==(const AbsolutePath &other) const noexcept;

		[[nodiscard]]
		auto operator<=>(const AbsolutePath &other) const noexcept -> std::weak_ordering;

		[[nodiscard]]
		auto hash() const noexcept -> size_t;

	private:
		struct Normalized {};
		AbsolutePath(Normalized, std::string normalized) : value(std::move(normalized)) {}

		std::string value;
	};

	[[nodiscard]]
	inline auto combine(const AbsolutePath &path, std::string_view segment) -> AbsolutePath
	{
		return path.combine(segment);
	}

	[[nodiscard]]
	inline auto concatRaw(const AbsolutePath &path, std::string_view suffix) -> AbsolutePath
	{
		return path.concat(suffix);
	}
} // namespace pathkit

template <>
struct std::hash<pathkit::AbsolutePath>
{
	size_t operator()(const pathkit::AbsolutePath &path) const noexcept { return path.hash(); }
};
