#include "io/directory_ops.hpp"

#include "io/content_hash.hpp"
#include "io/errors.hpp"
#include "io/path_syntax.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <ranges>
#include <spdlog/spdlog.h>
#include <unordered_set>
#include <utility>

namespace ranges = std::ranges;

namespace pathkit
{
	namespace
	{
		[[nodiscard]]
		auto toSortedPaths(const std::vector<fs::path> &entries) -> Paths
		{
			auto result = Paths{};
			result.reserve(entries.size());
			for (const auto &entry : entries) {
				result.push_back(AbsolutePath::fromNative(entry));
			}
			ranges::sort(result, {}, &AbsolutePath::str);
			return result;
		}

		void checkDepth(int depth)
		{
			if (depth < 0) {
				throw InvalidConfigurationError(
					fmt::format("The depth must be greater than or equal to zero, got {}", depth));
			}
		}

		[[nodiscard]]
		auto directoryNotFound(const AbsolutePath &path) -> DirectoryNotFoundError
		{
			return DirectoryNotFoundError(fmt::format("Directory '{}' not found", path.str()));
		}
	} // namespace

/*-----------------------------------------------------------------------------------------------*/
	DirectoryLevels::DirectoryLevels(AbsolutePath root,
									 std::string pattern,
									 int depth,
									 fs_utils::Attributes filter)
		: root(std::move(root)),
		  pattern(std::move(pattern)),
		  depth(depth),
		  filter(filter)
	{
		checkDepth(depth);
	}

	auto DirectoryLevels::begin() const -> iterator
	{
		auto walk = std::make_shared<iterator::Walk>();
		walk->pattern = pattern;
		walk->filter = filter;
		walk->remainingDepth = depth;
		walk->frontier = {root.native()};
		walk->advanceLevel();
		return iterator(std::move(walk));
	}

	auto DirectoryLevels::toVector() const -> Paths
	{
		auto result = Paths{};
		for (const auto &dir : *this) {
			result.push_back(dir);
		}
		return result;
	}

	auto DirectoryLevels::iterator::operator++() -> iterator &
	{
		++walk->index;
		if (walk->done()) {
			walk->advanceLevel();
		}
		return *this;
	}

	void DirectoryLevels::iterator::Walk::advanceLevel()
	{
		level.clear();
		index = 0;
		while (level.empty() && remainingDepth > 0 && !frontier.empty()) {
			auto matching = std::vector<fs::path>{};
			auto next = std::vector<fs::path>{};
			for (const auto &dir : frontier) {
				ranges::move(fs_utils::listEntries(dir, fs_utils::EntryKind::Directory, pattern, filter),
							 std::back_inserter(matching));
				ranges::move(fs_utils::listEntries(dir, fs_utils::EntryKind::Directory),
							 std::back_inserter(next));
			}
			level = toSortedPaths(matching);
			frontier = std::move(next);
			--remainingDepth;
		}
	}

/*-----------------------------------------------------------------------------------------------*/
	auto DirectoryOps::getFiles(std::string_view pattern /* = "*" */,
								int depth /* = 1 */,
								fs_utils::Attributes attributes /* = {} */) const
		-> Paths
	{
		checkDepth(depth);

		auto result = Paths{};
		auto pending = std::vector<std::pair<AbsolutePath, int>>{};
		if (depth > 0) {
			pending.emplace_back(source, depth);
		}
		while (!pending.empty()) {
			auto [dir, levels] = std::move(pending.back());
			pending.pop_back();

			const auto files = fs_utils::listEntries(dir.native(), fs_utils::EntryKind::File, pattern, attributes);
			ranges::move(toSortedPaths(files), std::back_inserter(result));

			if (levels <= 1) {
				continue;
			}
			// Reversed so that the smallest subdirectory is visited first.
			const auto subdirs = dir.directory().immediateDirectories();
			for (const auto &subdir : subdirs | std::views::reverse) {
				pending.emplace_back(subdir, levels - 1);
			}
		}
		return result;
	}

	auto DirectoryOps::getDirectories(std::string_view pattern /* = "*" */,
									  int depth /* = 1 */,
									  fs_utils::Attributes attributes /* = {} */) const
		-> DirectoryLevels
	{
		return DirectoryLevels(source, std::string(pattern), depth, attributes);
	}

	auto DirectoryOps::immediateDirectories() const -> Paths
	{
		return toSortedPaths(fs_utils::listEntries(source.native(), fs_utils::EntryKind::Directory));
	}

	auto DirectoryOps::create() const -> AbsolutePath
	{
		if (fs::create_directories(source.native())) {
			spdlog::debug("Created directory \"{}\"", source.str());
		}
		return source;
	}

	auto DirectoryOps::cleanAndRecreate() const -> AbsolutePath
	{
		remove();
		return create();
	}

	void DirectoryOps::remove() const
	{
		if (!exists()) {
			return;
		}
		fs_utils::clearReadOnlyRecursive(source.native());
		const auto removed = fs::remove_all(source.native());
		spdlog::debug("Removed directory \"{}\" ({} entries)", source.str(), removed);
	}

	bool DirectoryOps::exists() const
	{
		auto error = std::error_code{};
		return fs::is_directory(source.native(), error);
	}

	bool DirectoryOps::containsFile(std::string_view pattern, bool recursive /* = false */) const
	{
		return exists()
			&& fs_utils::anyEntry(source.native(), fs_utils::EntryKind::File, pattern, recursive);
	}

	bool DirectoryOps::containsDirectory(std::string_view pattern, bool recursive /* = false */) const
	{
		return exists()
			&& fs_utils::anyEntry(source.native(), fs_utils::EntryKind::Directory, pattern, recursive);
	}

	auto DirectoryOps::getDirectoryHash(const PathPredicate &includeFile /* = {} */) const -> std::string
	{
		if (!exists()) {
			throw directoryNotFound(source);
		}
		auto paths = Paths{};
		for (const auto &entry : fs::recursive_directory_iterator(source.native())) {
			if (!entry.is_regular_file()) {
				continue;
			}
			auto path = AbsolutePath::fromNative(entry.path());
			if (!includeFile || includeFile(path)) {
				paths.push_back(std::move(path));
			}
		}
		return fileSetHash(paths, source);
	}

	auto DirectoryOps::getFileSetHash(const Paths &paths, const AbsolutePath &baseDirectory) -> std::string
	{
		return fileSetHash(paths, baseDirectory);
	}

	void DirectoryOps::prepareTarget(const AbsolutePath &target, ExistsPolicy policy, bool createParents) const
	{
		if (!exists()) {
			throw directoryNotFound(source);
		}
		if (fs_utils::startsWith(target.native(), source.native())) {
			throw InvalidTargetError(fmt::format("Target directory '{}' is inside source directory '{}'",
												 target.str(), source.str()));
		}
		checkFilePolicy(policy);
		checkDirectoryConflict(policy, target.str(), target.directory().exists());

		if (createParents) {
			target.directory().create();
		} else if (fs::create_directory(target.native())) {
			spdlog::debug("Created directory \"{}\"", target.str());
		}
	}

	auto DirectoryOps::move(const AbsolutePath &target,
							ExistsPolicy policy /* = policies::Fail */,
							bool createParents /* = true */,
							bool deleteRemainingFiles /* = false */) const
		-> AbsolutePath
	{
		prepareTarget(target, policy, createParents);

		for (const auto &subdir : immediateDirectories()) {
			subdir.directory().move(target / subdir.name(), policy);
		}
		for (const auto &file : getFiles()) {
			file.file().move(target / file.name(), policy);
		}

		if (fs::is_empty(source.native()) || deleteRemainingFiles) {
			remove();
		}
		spdlog::debug("Moved directory \"{}\" to \"{}\"", source.str(), target.str());
		return target;
	}

	auto DirectoryOps::copy(const AbsolutePath &target,
							ExistsPolicy policy /* = policies::Fail */,
							const CopyFilters &filters /* = {} */,
							bool createParents /* = true */) const
		-> AbsolutePath
	{
		prepareTarget(target, policy, createParents);

		for (const auto &subdir : immediateDirectories()) {
			if (filters.excludeDirectory && filters.excludeDirectory(subdir)) {
				continue;
			}
			subdir.directory().copy(target / subdir.name(), policy, filters);
		}
		for (const auto &file : getFiles()) {
			if (filters.excludeFile && filters.excludeFile(file)) {
				continue;
			}
			file.file().copy(target / file.name(), policy);
		}
		spdlog::debug("Copied directory \"{}\" to \"{}\"", source.str(), target.str());
		return target;
	}

	auto DirectoryOps::moveTo(const AbsolutePath &targetDir,
							  ExistsPolicy policy /* = policies::Fail */,
							  bool createParents /* = true */,
							  bool deleteRemainingFiles /* = false */) const
		-> AbsolutePath
	{
		return move(targetDir / source.name(), policy, createParents, deleteRemainingFiles);
	}

	auto DirectoryOps::copyTo(const AbsolutePath &targetDir,
							  ExistsPolicy policy /* = policies::Fail */,
							  const CopyFilters &filters /* = {} */,
							  bool createParents /* = true */) const
		-> AbsolutePath
	{
		return copy(targetDir / source.name(), policy, filters, createParents);
	}

	auto DirectoryOps::rename(std::string_view newName, ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		const auto parent = source.parent();
		if (!parent.has_value()) {
			throw InvalidTargetError(fmt::format("The root '{}' cannot be renamed", source.str()));
		}
		return move(parent->combine(newName), policy);
	}

	auto DirectoryOps::rename(const NameGenerator &newName, ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		return rename(newName(source), policy);
	}

	auto DirectoryOps::findParentOrSelf(const PathPredicate &predicate) const -> std::optional<AbsolutePath>
	{
		if (!exists()) {
			return std::nullopt;
		}
		return findAncestor(source, predicate, /*includeSelf=*/true);
	}

/*-----------------------------------------------------------------------------------------------*/
	auto fileSetHash(const Paths &paths, const AbsolutePath &baseDirectory) -> std::string
	{
		struct Entry
		{
			std::string relativePath;
			const AbsolutePath *path;
		};

		auto seen = std::unordered_set<AbsolutePath>{};
		auto entries = std::vector<Entry>{};
		for (const auto &path : paths) {
			if (!seen.insert(path).second) {
				continue;
			}
			if (!path.file().exists()) {
				throw FileNotFoundError(fmt::format("File '{}' not found", path.str()));
			}
			const auto relative = syntax::relativeTo(baseDirectory.str(), path.str());
			entries.push_back({syntax::normalize(relative, syntax::kUnixSeparator), &path});
		}
		ranges::sort(entries, {}, &Entry::relativePath);

		auto md5 = hash::Md5Stream{};
		for (const auto &[relativePath, path] : entries) {
			md5.update(relativePath);
			md5.updateFromFile(path->native());
		}
		return hash::toHex(md5.finalize());
	}
} // namespace pathkit
