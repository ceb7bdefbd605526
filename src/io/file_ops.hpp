#pragma once

#include "io/absolute_path.hpp"
#include "io/exists_policy.hpp"
#include "io/settings.hpp"
#include "io/text_codec.hpp"

#include <concepts>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace pathkit
{
	using PathPredicate = std::function<bool(const AbsolutePath &)>;
	using NameGenerator = std::function<std::string(const AbsolutePath &)>;

	/*------------------------------------------------------------------------
	--  Operations on a path that denotes a file.
	--
	--  Text operations fall back to textSettings() for every unset optional
	--  argument. Parent directories are created on demand by the writers.
	------------------------------------------------------------------------*/
	class FileOps
	{
	public:
		explicit FileOps(AbsolutePath path) : source(std::move(path)) {}

		[[nodiscard]]
		const AbsolutePath &path() const noexcept { return source; }

		[[nodiscard]]
		bool exists() const;

		// Creates the file when missing and sets its last write time ('time' or now).
		auto touch(std::optional<fs::file_time_type> time = std::nullopt,
				   bool createParents = true) const
			-> AbsolutePath;

		void remove() const;

		[[nodiscard]]
		auto readAllText(std::optional<Encoding> encoding = std::nullopt) const -> std::string;

		[[nodiscard]]
		auto readAllLines(std::optional<Encoding> encoding = std::nullopt) const -> text::Lines;

		[[nodiscard]]
		auto readAllBytes() const -> text::Bytes;

		auto writeAllText(std::string_view content,
						  std::optional<Encoding> encoding = std::nullopt,
						  std::optional<bool> eofLineBreak = std::nullopt) const
			-> AbsolutePath;

		auto writeAllLines(const text::Lines &lines,
						   std::optional<Encoding> encoding = std::nullopt,
						   std::optional<LineBreak> lineBreak = std::nullopt,
						   std::optional<bool> eofLineBreak = std::nullopt) const
			-> AbsolutePath;

		auto writeAllBytes(const text::Bytes &bytes) const -> AbsolutePath;

		auto appendAllText(std::string_view content,
						   std::optional<Encoding> encoding = std::nullopt) const
			-> AbsolutePath;

		// Every line is followed by the effective line terminator.
		auto appendAllLines(const text::Lines &lines,
							std::optional<Encoding> encoding = std::nullopt) const
			-> AbsolutePath;

		// Read-modify-write, not atomic.
		auto updateText(const std::function<std::string(std::string)> &transform,
						std::optional<Encoding> encoding = std::nullopt) const
			-> AbsolutePath;

		// Lower-case hex MD5 of the content.
		[[nodiscard]]
		auto getHash() const -> std::string;

		// Extension with its leading dot, empty when there is none.
		[[nodiscard]]
		auto extension() const -> std::string;

		[[nodiscard]]
		auto nameWithoutExtension() const -> std::string;

		// Case-insensitive suffix match against any of the candidates.
		[[nodiscard]]
		bool hasExtension(std::string_view extension,
						  std::convertible_to<std::string_view> auto... alternatives) const
		{
			return hasAnyExtension({extension, std::string_view(alternatives)...});
		}

		[[nodiscard]]
		auto withExtension(std::string_view extension) const -> std::optional<AbsolutePath>;

		// Returns the resulting path, or the source itself when the policy skipped.
		auto move(const AbsolutePath &target,
				  ExistsPolicy policy = policies::Fail,
				  bool createParents = true) const
			-> AbsolutePath;

		auto copy(const AbsolutePath &target,
				  ExistsPolicy policy = policies::Fail,
				  bool createParents = true) const
			-> AbsolutePath;

		auto moveTo(const AbsolutePath &targetDir,
					ExistsPolicy policy = policies::Fail,
					bool createParents = true) const
			-> AbsolutePath;

		auto copyTo(const AbsolutePath &targetDir,
					ExistsPolicy policy = policies::Fail,
					bool createParents = true) const
			-> AbsolutePath;

		auto rename(std::string_view newName, ExistsPolicy policy = policies::Fail) const
			-> AbsolutePath;
		auto rename(const NameGenerator &newName, ExistsPolicy policy = policies::Fail) const
			-> AbsolutePath;

		// Renames the stem and keeps the current extension.
		auto renameWithoutExtension(std::string_view newStem, ExistsPolicy policy = policies::Fail) const
			-> AbsolutePath;
		auto renameWithoutExtension(const NameGenerator &newStem, ExistsPolicy policy = policies::Fail) const
			-> AbsolutePath;

		// First ancestor (excluding self) matching 'predicate'. Empty when the file is missing.
		[[nodiscard]]
		auto findParent(const PathPredicate &predicate) const -> std::optional<AbsolutePath>;

		[[nodiscard]]
		auto findParentOrSelf(const PathPredicate &predicate) const -> std::optional<AbsolutePath>;

	private:
		[[nodiscard]]
		bool hasAnyExtension(std::initializer_list<std::string_view> candidates) const;

		void createParentDirectory() const;

		template <typename Action>
		auto handleConflict(const AbsolutePath &target,
							ExistsPolicy policy,
							bool createParents,
							Action &&action) const
			-> AbsolutePath;

		[[nodiscard]]
		auto siblingPath(std::string_view newName) const -> AbsolutePath;

	private:
		AbsolutePath source;
	};

	// Walks from 'start' (included when 'includeSelf') up to the root.
	[[nodiscard]]
	auto findAncestor(const AbsolutePath &start, const PathPredicate &predicate, bool includeSelf)
		-> std::optional<AbsolutePath>;
} // namespace pathkit
