#include "io/absolute_path.hpp"

#include "io/directory_ops.hpp"
#include "io/errors.hpp"
#include "io/file_ops.hpp"
#include "io/path_syntax.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace pathkit
{
	namespace
	{
		[[nodiscard]]
		char foldCase(char c) noexcept
		{
			return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
		}
	} // namespace

	AbsolutePath::AbsolutePath(std::string_view path)
	{
		if (!syntax::hasRoot(path)) {
			throw MalformedPathError(fmt::format("Path '{}' must be rooted", path));
		}
		value = syntax::normalize(path);
	}

	auto AbsolutePath::tryParse(std::string_view path) -> std::optional<AbsolutePath>
	{
		if (!syntax::hasRoot(path)) {
			return std::nullopt;
		}
		try {
			return AbsolutePath(Normalized{}, syntax::normalize(path));
		} catch (const PathError &) {
			return std::nullopt;
		}
	}

	auto AbsolutePath::fromNative(const fs::path &path) -> AbsolutePath
	{
		return AbsolutePath(path.generic_string());
	}

	bool AbsolutePath::isWindowsRooted() const noexcept
	{
		return syntax::hasWindowsRoot(value);
	}

	bool AbsolutePath::isRoot() const noexcept
	{
		auto trimmed = std::string_view(value);
		if (trimmed.ends_with(syntax::kWindowsSeparator)) {
			trimmed.remove_suffix(1);
		}
		return syntax::isWindowsRoot(trimmed) || syntax::isUnixRoot(trimmed);
	}

	auto AbsolutePath::name() const -> std::string
	{
		if (isRoot()) {
			return {};
		}
		const auto pos = value.find_last_of(syntax::separatorOf(value));
		return value.substr(pos + 1);
	}

	auto AbsolutePath::parent() const -> std::optional<AbsolutePath>
	{
		if (isRoot()) {
			return std::nullopt;
		}
		const auto pos = value.find_last_of(syntax::separatorOf(value));
		if (pos == std::string::npos) {
			return std::nullopt;
		}
		// Keep the separator when the parent is the root itself: "/" or "C:\".
		const auto head = std::string_view(value).substr(0, pos);
		if (head.empty() || syntax::isWindowsRoot(head)) {
			return AbsolutePath(Normalized{}, syntax::normalize(value.substr(0, pos + 1)));
		}
		return AbsolutePath(Normalized{}, std::string(head));
	}

	auto AbsolutePath::combine(std::string_view segment) const -> AbsolutePath
	{
		if (syntax::hasRoot(segment)) {
			throw MalformedPathError(
				fmt::format("Cannot combine '{}' with the rooted path '{}'", value, segment));
		}
		return AbsolutePath(Normalized{}, syntax::normalize(syntax::combine(value, segment)));
	}

	auto AbsolutePath::concat(std::string_view suffix) const -> AbsolutePath
	{
		return AbsolutePath(value + std::string(suffix));
	}

	auto AbsolutePath::relativeTo(const AbsolutePath &base) const -> std::string
	{
		return syntax::relativeTo(base.value, value);
	}

	auto AbsolutePath::file() const -> FileOps
	{
		return FileOps(*this);
	}

	auto AbsolutePath::directory() const -> DirectoryOps
	{
		return DirectoryOps(*this);
	}

	bool AbsolutePath::operator==(const AbsolutePath &other) const noexcept
	{
		if (isWindowsRooted()) {
			return syntax::equalsIgnoreCase(value, other.value);
		}
		return value == other.value;
	}

	auto AbsolutePath::operator<=>(const AbsolutePath &other) const noexcept -> std::weak_ordering
	{
		if (isWindowsRooted() && other.isWindowsRooted()) {
			return std::lexicographical_compare_three_way(
				value.begin(), value.end(), other.value.begin(), other.value.end(),
				[](char a, char b) { return foldCase(a) <=> foldCase(b); });
		}
		return value <=> other.value;
	}

	auto AbsolutePath::hash() const noexcept -> size_t
	{
		if (!isWindowsRooted()) {
			return std::hash<std::string>{}(value);
		}
		// Folded one character at a time so hashing never allocates.
		auto seed = size_t{0};
		for (const char c : value) {
			seed ^= std::hash<char>{}(foldCase(c)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
		}
		return seed;
	}
} // namespace pathkit
