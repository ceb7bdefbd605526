#include "io/path_syntax.hpp"

#include "io/errors.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <ranges>
#include <vector>

namespace ranges = std::ranges;

namespace pathkit::syntax
{
	namespace
	{
		using Segments = std::vector<std::string_view>;

		constexpr std::string_view kCurrentDir = ".";
		constexpr std::string_view kParentDir = "..";

		[[nodiscard]]
		char toLowerAscii(char c) noexcept
		{
			return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
		}

		[[nodiscard]]
		auto split(std::string_view path, bool onAnySeparator, char separator = kUnixSeparator)
			-> Segments
		{
			auto segments = Segments{};
			size_t start = 0;
			for (size_t i = 0; i <= path.size(); ++i) {
				const bool atEnd = i == path.size();
				const bool atSeparator =
					!atEnd && (onAnySeparator ? isSeparator(path[i]) : path[i] == separator);
				if (atEnd || atSeparator) {
					if (i > start) {
						segments.push_back(path.substr(start, i - start));
					}
					start = i + 1;
				}
			}
			return segments;
		}

		[[nodiscard]]
		auto join(const auto &segments, char separator) -> std::string
		{
			auto result = std::string{};
			for (const auto &segment : segments) {
				if (!result.empty()) {
					result += separator;
				}
				result.append(segment);
			}
			return result;
		}

		[[nodiscard]]
		auto trimTrailingSeparators(std::string_view path) -> std::string_view
		{
			if (isUnixRoot(path)) {
				return path;
			}
			while (!path.empty() && isSeparator(path.back())) {
				path.remove_suffix(1);
			}
			return path;
		}

		[[nodiscard]]
		bool isBlank(std::string_view str) noexcept
		{
			return ranges::all_of(str, [](char c) { return c == ' ' || (c >= '\t' && c <= '\r'); });
		}

		void checkSeparatorChoice(std::string_view path, std::optional<char> separator)
		{
			if (!separator.has_value()) {
				return;
			}
			const auto root = getRoot(path);
			if (!root.has_value()) {
				return;
			}
			if (isWindowsRoot(*root) && *separator != kWindowsSeparator) {
				throw SeparatorConflictError(
					fmt::format("For Windows-rooted paths the separator must be '{}': '{}'",
								kWindowsSeparator, path));
			}
			if (isUnixRoot(*root) && *separator != kUnixSeparator) {
				throw SeparatorConflictError(
					fmt::format("For Unix-rooted paths the separator must be '{}': '{}'",
								kUnixSeparator, path));
			}
		}

		[[nodiscard]]
		bool sameRoot(std::string_view lhs, std::string_view rhs) noexcept
		{
			const auto lhsRoot = getRoot(lhs);
			const auto rhsRoot = getRoot(rhs);
			if (!lhsRoot || !rhsRoot) {
				return lhsRoot.has_value() == rhsRoot.has_value();
			}
			return equalsIgnoreCase(*lhsRoot, *rhsRoot);
		}
	} // namespace

	bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
	{
		return ranges::equal(lhs, rhs, [](char a, char b) { return toLowerAscii(a) == toLowerAscii(b); });
	}

	bool endsWithIgnoreCase(std::string_view str, std::string_view suffix) noexcept
	{
		return str.size() >= suffix.size()
			&& equalsIgnoreCase(str.substr(str.size() - suffix.size()), suffix);
	}

	auto normalize(std::string_view path, std::optional<char> separator /* = std::nullopt */)
		-> std::string
	{
		checkSeparatorChoice(path, separator);

		const auto sep = separator.value_or(separatorOf(path));
		const auto root = getRoot(path);
		const auto tail = root ? path.substr(root->size()) : path;

		auto parts = split(tail, /*onAnySeparator=*/true);
		for (size_t i = 0; i < parts.size();) {
			const auto part = parts[i];
			if (part == kCurrentDir) {
				parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(i));
				continue;
			}
			if (part != kParentDir) {
				++i;
				continue;
			}
			const auto preceding = ranges::subrange(parts.begin(), parts.begin() + static_cast<std::ptrdiff_t>(i));
			if (ranges::all_of(preceding, [](auto p) { return p == kParentDir; })) {
				// Nothing left to cancel: only relative paths may keep leading "..".
				if (i == 0 && root.has_value()) {
					throw RootBoundaryError(
						fmt::format("Cannot normalize '{}' beyond path root", path));
				}
				++i;
				continue;
			}
			parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(i - 1),
						parts.begin() + static_cast<std::ptrdiff_t>(i + 1));
			--i;
		}

		return combine(root.value_or(std::string_view{}), join(parts, sep), sep);
	}

	auto combine(std::string_view left,
				 std::string_view right,
				 std::optional<char> separator /* = std::nullopt */)
		-> std::string
	{
		left = trimTrailingSeparators(left);
		right = trimTrailingSeparators(right);

		if (hasRoot(right)) {
			throw MalformedPathError(fmt::format("Second path must not be rooted: '{}'", right));
		}
		if (isBlank(left)) {
			return std::string(right);
		}
		if (isBlank(right)) {
			return isWindowsRoot(left) ? fmt::format("{}{}", left, kWindowsSeparator)
									   : std::string(left);
		}

		checkSeparatorChoice(left, separator);
		const auto sep = separator.value_or(separatorOf(left));

		if (isWindowsRoot(left)) {
			return fmt::format("{}{}{}", left, kWindowsSeparator, right);
		}
		if (isUnixRoot(left)) {
			return fmt::format("{}{}", left, right);
		}
		return fmt::format("{}{}{}", left, sep, right);
	}

	auto relativeTo(std::string_view basePath, std::string_view destinationPath)
		-> std::string
	{
		const auto base = normalize(basePath);
		const auto destination = normalize(destinationPath);

		const auto sep = separatorOf(base);
		if (sep != separatorOf(destination)) {
			throw SeparatorConflictError(
				fmt::format("Separators do not match: '{}' and '{}'", base, destination));
		}
		if (!sameRoot(base, destination)) {
			throw SeparatorConflictError(
				fmt::format("Roots do not match: '{}' and '{}'", base, destination));
		}
		if (isWindowsRoot(trimTrailingSeparators(base))) {
			throw SeparatorConflictError(
				fmt::format("Relative paths from a drive root are not supported: '{}'", base));
		}

		const bool ignoreCase = hasWindowsRoot(base);
		const auto baseParts = split(base, /*onAnySeparator=*/false, sep);
		const auto destinationParts = split(destination, /*onAnySeparator=*/false, sep);

		size_t same = 0;
		while (same < baseParts.size() && same < destinationParts.size()) {
			const auto &a = baseParts[same];
			const auto &b = destinationParts[same];
			if (ignoreCase ? !equalsIgnoreCase(a, b) : a != b) {
				break;
			}
			++same;
		}

		auto result = Segments(baseParts.size() - same, kParentDir);
		result.insert(result.end(),
					  destinationParts.begin() + static_cast<std::ptrdiff_t>(same),
					  destinationParts.end());
		return join(result, sep);
	}
} // namespace pathkit::syntax
