#pragma once

#include "io/absolute_path.hpp"
#include "io/exists_policy.hpp"
#include "io/file_ops.hpp"
#include "utils/filesystem.hpp"

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathkit
{
	using Paths = std::vector<AbsolutePath>;

	/*------------------------------------------------------------------------
	--  Breadth-first listing of the directories below 'root'.
	--
	--  Every call to begin() starts a fresh traversal. Each level is read only
	--  when the previous one has been consumed, and its matches come sorted.
	------------------------------------------------------------------------*/
	class DirectoryLevels
	{
	public:
		DirectoryLevels(AbsolutePath root, std::string pattern, int depth, fs_utils::Attributes filter);

		class iterator
		{
		public:
			using value_type = AbsolutePath;
			using difference_type = std::ptrdiff_t;
			using iterator_category = std::input_iterator_tag;

			iterator() = default;

			const AbsolutePath &operator*() const noexcept { return walk->level[walk->index]; }
			const AbsolutePath *operator->() const noexcept { return &**this; }

			iterator &operator++();
			void operator++(int) { ++(*this); }

			bool operator==(std::default_sentinel_t) const noexcept { return !walk || walk->done(); }

		private:
			friend class DirectoryLevels;

			struct Walk
			{
				std::string pattern;
				fs_utils::Attributes filter;
				int remainingDepth{0};
				std::vector<fs::path> frontier;
				Paths level;
				size_t index{0};

				[[nodiscard]]
				bool done() const noexcept { return index >= level.size(); }

				// Loads the next level with at least one match, if any.
				void advanceLevel();
			};

			explicit iterator(std::shared_ptr<Walk> walk) : walk(std::move(walk)) {}

			std::shared_ptr<Walk> walk;
		};

		[[nodiscard]]
		auto begin() const -> iterator;

		[[nodiscard]]
		std::default_sentinel_t end() const noexcept { return {}; }

		[[nodiscard]]
		auto toVector() const -> Paths;

	private:
		AbsolutePath root;
		std::string pattern;
		int depth;
		fs_utils::Attributes filter;
	};

	struct CopyFilters
	{
		PathPredicate excludeDirectory{};
		PathPredicate excludeFile{};
	};

	/*------------------------------------------------------------------------
	--  Operations on a path that denotes a directory.
	------------------------------------------------------------------------*/
	class DirectoryOps
	{
	public:
		explicit DirectoryOps(AbsolutePath path) : source(std::move(path)) {}

		[[nodiscard]]
		const AbsolutePath &path() const noexcept { return source; }

		// Files of this directory, then of its subdirectories (depth-first), down to
		// 'depth' levels. Each directory's own files come sorted by full path.
		[[nodiscard]]
		auto getFiles(std::string_view pattern = "*",
					  int depth = 1,
					  fs_utils::Attributes attributes = {}) const
			-> Paths;

		[[nodiscard]]
		auto getDirectories(std::string_view pattern = "*",
							int depth = 1,
							fs_utils::Attributes attributes = {}) const
			-> DirectoryLevels;

		auto create() const -> AbsolutePath;
		auto cleanAndRecreate() const -> AbsolutePath;
		void remove() const;

		[[nodiscard]]
		bool exists() const;

		[[nodiscard]]
		bool containsFile(std::string_view pattern, bool recursive = false) const;

		[[nodiscard]]
		bool containsDirectory(std::string_view pattern, bool recursive = false) const;

		// Lower-case hex MD5 over every file below the directory accepted by 'includeFile'.
		[[nodiscard]]
		auto getDirectoryHash(const PathPredicate &includeFile = {}) const -> std::string;

		[[nodiscard]]
		static auto getFileSetHash(const Paths &paths, const AbsolutePath &baseDirectory) -> std::string;

		// Mirrors the tree into 'target' and removes what is left of the source when it
		// ends up empty, or unconditionally with 'deleteRemainingFiles'.
		auto move(const AbsolutePath &target,
				  ExistsPolicy policy = policies::Fail,
				  bool createParents = true,
				  bool deleteRemainingFiles = false) const
			-> AbsolutePath;

		auto copy(const AbsolutePath &target,
				  ExistsPolicy policy = policies::Fail,
				  const CopyFilters &filters = {},
				  bool createParents = true) const
			-> AbsolutePath;

		auto moveTo(const AbsolutePath &targetDir,
					ExistsPolicy policy = policies::Fail,
					bool createParents = true,
					bool deleteRemainingFiles = false) const
			-> AbsolutePath;

		auto copyTo(const AbsolutePath &targetDir,
					ExistsPolicy policy = policies::Fail,
					const CopyFilters &filters = {},
					bool createParents = true) const
			-> AbsolutePath;

		auto rename(std::string_view newName, ExistsPolicy policy = policies::Fail) const -> AbsolutePath;
		auto rename(const NameGenerator &newName, ExistsPolicy policy = policies::Fail) const -> AbsolutePath;

		[[nodiscard]]
		auto findParentOrSelf(const PathPredicate &predicate) const -> std::optional<AbsolutePath>;

	private:
		// Existence, self-nesting and directory policy checks shared by move and copy.
		void prepareTarget(const AbsolutePath &target, ExistsPolicy policy, bool createParents) const;

		[[nodiscard]]
		auto immediateDirectories() const -> Paths;

	private:
		AbsolutePath source;
	};

	// Digest of (relative path, content) pairs for the distinct 'paths', ordered by path.
	// Relative paths are taken from 'baseDirectory' and always use '/'.
	[[nodiscard]]
	auto fileSetHash(const Paths &paths, const AbsolutePath &baseDirectory) -> std::string;
} // namespace pathkit
