#include "io/file_ops.hpp"

#include "io/content_hash.hpp"
#include "io/directory_ops.hpp"
#include "io/errors.hpp"
#include "io/path_syntax.hpp"

#include <fmt/core.h>
#include <ranges>
#include <spdlog/spdlog.h>

namespace ranges = std::ranges;

namespace pathkit
{
	namespace
	{
		[[nodiscard]]
		auto resolveEncoding(std::optional<Encoding> encoding) noexcept -> Encoding
		{
			return encoding.value_or(textSettings().encoding);
		}

		[[nodiscard]]
		auto rootHasNoParent(const AbsolutePath &path) -> InvalidTargetError
		{
			return InvalidTargetError(fmt::format("The root '{}' does not have a parent", path.str()));
		}
	} // namespace

	bool FileOps::exists() const
	{
		auto error = std::error_code{};
		return fs::is_regular_file(source.native(), error);
	}

	auto FileOps::touch(std::optional<fs::file_time_type> time /* = std::nullopt */,
						bool createParents /* = true */) const
		-> AbsolutePath
	{
		if (createParents) {
			createParentDirectory();
		}
		if (!exists()) {
			fs_utils::writeBytes(source.native(), {});
		}
		fs::last_write_time(source.native(), time.value_or(fs::file_time_type::clock::now()));
		spdlog::debug("Touched \"{}\"", source.str());
		return source;
	}

	void FileOps::remove() const
	{
		if (!exists()) {
			return;
		}
		fs_utils::clearReadOnly(source.native());
		fs::remove(source.native());
		spdlog::debug("Removed file \"{}\"", source.str());
	}

	auto FileOps::readAllText(std::optional<Encoding> encoding /* = std::nullopt */) const
		-> std::string
	{
		return text::decode(readAllBytes(), resolveEncoding(encoding));
	}

	auto FileOps::readAllLines(std::optional<Encoding> encoding /* = std::nullopt */) const
		-> text::Lines
	{
		return text::splitLines(readAllText(encoding));
	}

	auto FileOps::readAllBytes() const -> text::Bytes
	{
		if (!exists()) {
			throw FileNotFoundError(fmt::format("File '{}' not found", source.str()));
		}
		return fs_utils::readBytes(source.native());
	}

	auto FileOps::writeAllText(std::string_view content,
							   std::optional<Encoding> encoding /* = std::nullopt */,
							   std::optional<bool> eofLineBreak /* = std::nullopt */) const
		-> AbsolutePath
	{
		createParentDirectory();

		const auto data = eofLineBreak.value_or(textSettings().eofLineBreak)
							  ? text::withSingleEofLineBreak(content)
							  : std::string(content);
		fs_utils::writeBytes(source.native(), text::encode(data, resolveEncoding(encoding)));
		spdlog::debug("Wrote {} characters to \"{}\"", data.size(), source.str());
		return source;
	}

	auto FileOps::writeAllLines(const text::Lines &lines,
								std::optional<Encoding> encoding /* = std::nullopt */,
								std::optional<LineBreak> lineBreak /* = std::nullopt */,
								std::optional<bool> eofLineBreak /* = std::nullopt */) const
		-> AbsolutePath
	{
		auto all = lines;
		if (eofLineBreak.value_or(textSettings().eofLineBreak)) {
			all.emplace_back();
		}
		const auto content = text::joinLines(all, effectiveLineTerminator(lineBreak));
		return writeAllText(content, encoding, /*eofLineBreak=*/false);
	}

	auto FileOps::writeAllBytes(const text::Bytes &bytes) const -> AbsolutePath
	{
		createParentDirectory();
		fs_utils::writeBytes(source.native(), bytes);
		spdlog::debug("Wrote {} bytes to \"{}\"", bytes.size(), source.str());
		return source;
	}

	auto FileOps::appendAllText(std::string_view content,
								std::optional<Encoding> encoding /* = std::nullopt */) const
		-> AbsolutePath
	{
		createParentDirectory();

		const bool isEmpty = !exists() || fs::file_size(source.native()) == 0;
		const auto bytes = text::encode(content, resolveEncoding(encoding), /*withPreamble=*/isEmpty);
		fs_utils::writeBytes(source.native(), bytes, /*append=*/true);
		return source;
	}

	auto FileOps::appendAllLines(const text::Lines &lines,
								 std::optional<Encoding> encoding /* = std::nullopt */) const
		-> AbsolutePath
	{
		const auto terminator = effectiveLineTerminator();
		auto content = std::string{};
		for (const auto &line : lines) {
			content.append(line);
			content.append(terminator);
		}
		return appendAllText(content, encoding);
	}

	auto FileOps::updateText(const std::function<std::string(std::string)> &transform,
							 std::optional<Encoding> encoding /* = std::nullopt */) const
		-> AbsolutePath
	{
		return writeAllText(transform(readAllText(encoding)), encoding);
	}

	auto FileOps::getHash() const -> std::string
	{
		if (!exists()) {
			throw FileNotFoundError(fmt::format("File '{}' not found", source.str()));
		}
		return hash::fileHash(source.native());
	}

	auto FileOps::extension() const -> std::string
	{
		const auto name = source.name();
		const auto dot = name.find_last_of('.');
		if (dot == std::string::npos || dot == 0) {
			return {};
		}
		return name.substr(dot);
	}

	auto FileOps::nameWithoutExtension() const -> std::string
	{
		const auto name = source.name();
		return name.substr(0, name.size() - extension().size());
	}

	bool FileOps::hasAnyExtension(std::initializer_list<std::string_view> candidates) const
	{
		return ranges::any_of(candidates, [this](std::string_view candidate) {
			return syntax::endsWithIgnoreCase(source.str(), candidate);
		});
	}

	auto FileOps::withExtension(std::string_view extension) const -> std::optional<AbsolutePath>
	{
		const auto parent = source.parent();
		if (!parent.has_value()) {
			return std::nullopt;
		}
		auto name = nameWithoutExtension();
		if (!extension.empty()) {
			if (!extension.starts_with('.')) {
				name += '.';
			}
			name.append(extension);
		}
		return parent->combine(name);
	}

	template <typename Action>
	auto FileOps::handleConflict(const AbsolutePath &target,
								 ExistsPolicy policy,
								 bool createParents,
								 Action &&action) const
		-> AbsolutePath
	{
		if (!exists()) {
			throw FileNotFoundError(fmt::format("File '{}' not found", source.str()));
		}
		if (target == source) {
			return source;
		}
		if (target.file().exists()) {
			const auto decision = decideFileConflict(policy,
													 target.str(),
													 fs::last_write_time(source.native()),
													 fs::last_write_time(target.native()));
			if (decision == ConflictDecision::Skip) {
				spdlog::debug("Skipped \"{}\", \"{}\" already exists", source.str(), target.str());
				return source;
			}
		}
		if (createParents) {
			target.file().createParentDirectory();
		}
		action();
		return target;
	}

	auto FileOps::move(const AbsolutePath &target,
					   ExistsPolicy policy /* = policies::Fail */,
					   bool createParents /* = true */) const
		-> AbsolutePath
	{
		return handleConflict(target, policy, createParents, [this, &target]() {
			target.file().remove();
			fs_utils::moveFile(source.native(), target.native());
			spdlog::debug("Moved \"{}\" to \"{}\"", source.str(), target.str());
		});
	}

	auto FileOps::copy(const AbsolutePath &target,
					   ExistsPolicy policy /* = policies::Fail */,
					   bool createParents /* = true */) const
		-> AbsolutePath
	{
		return handleConflict(target, policy, createParents, [this, &target]() {
			if (target.file().exists()) {
				fs_utils::clearReadOnly(target.native());
			}
			fs::copy_file(source.native(), target.native(), fs::copy_options::overwrite_existing);
			spdlog::debug("Copied \"{}\" to \"{}\"", source.str(), target.str());
		});
	}

	auto FileOps::moveTo(const AbsolutePath &targetDir,
						 ExistsPolicy policy /* = policies::Fail */,
						 bool createParents /* = true */) const
		-> AbsolutePath
	{
		return move(targetDir / source.name(), policy, createParents);
	}

	auto FileOps::copyTo(const AbsolutePath &targetDir,
						 ExistsPolicy policy /* = policies::Fail */,
						 bool createParents /* = true */) const
		-> AbsolutePath
	{
		return copy(targetDir / source.name(), policy, createParents);
	}

	auto FileOps::siblingPath(std::string_view newName) const -> AbsolutePath
	{
		const auto parent = source.parent();
		if (!parent.has_value()) {
			throw rootHasNoParent(source);
		}
		return parent->combine(newName);
	}

	auto FileOps::rename(std::string_view newName, ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		return move(siblingPath(newName), policy);
	}

	auto FileOps::rename(const NameGenerator &newName, ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		return rename(newName(source), policy);
	}

	auto FileOps::renameWithoutExtension(std::string_view newStem,
										 ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		return move(siblingPath(newStem).concat(extension()), policy);
	}

	auto FileOps::renameWithoutExtension(const NameGenerator &newStem,
										 ExistsPolicy policy /* = policies::Fail */) const
		-> AbsolutePath
	{
		return renameWithoutExtension(newStem(source), policy);
	}

	auto FileOps::findParent(const PathPredicate &predicate) const -> std::optional<AbsolutePath>
	{
		if (!exists()) {
			return std::nullopt;
		}
		return findAncestor(source, predicate, /*includeSelf=*/false);
	}

	auto FileOps::findParentOrSelf(const PathPredicate &predicate) const -> std::optional<AbsolutePath>
	{
		if (!exists()) {
			return std::nullopt;
		}
		return findAncestor(source, predicate, /*includeSelf=*/true);
	}

	void FileOps::createParentDirectory() const
	{
		if (const auto parent = source.parent(); parent.has_value()) {
			parent->directory().create();
		}
	}

	auto findAncestor(const AbsolutePath &start, const PathPredicate &predicate, bool includeSelf)
		-> std::optional<AbsolutePath>
	{
		auto current = includeSelf ? std::optional(start) : start.parent();
		while (current.has_value()) {
			if (predicate(*current)) {
				return current;
			}
			current = current->parent();
		}
		return std::nullopt;
	}
} // namespace pathkit
