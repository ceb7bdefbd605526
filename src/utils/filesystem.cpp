#include "utils/filesystem.hpp"

#include <fmt/core.h>
#include <fnmatch.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs_utils
{
	bool matchesWildcard(std::string_view name, std::string_view pattern)
	{
		if (pattern.empty() || pattern == "*") {
			return true;
		}
		const auto nameStr = std::string(name);
		const auto patternStr = std::string(pattern);
		return ::fnmatch(patternStr.c_str(), nameStr.c_str(), 0) == 0;
	}

	auto attributesOf(const fs::path &path) -> Attributes
	{
		auto result = Attributes{};

		const auto linkStatus = fs::symlink_status(path);
		if (fs::is_symlink(linkStatus)) {
			result.insert(Attribute::Symlink);
		}
		const auto filename = path.filename().native();
		if (filename.starts_with('.') && filename != "." && filename != "..") {
			result.insert(Attribute::Hidden);
		}
		const auto perms = fs::status(path).permissions();
		if ((perms & fs::perms::owner_write) == fs::perms::none) {
			result.insert(Attribute::ReadOnly);
		}
		if ((perms & fs::perms::owner_exec) != fs::perms::none) {
			result.insert(Attribute::Executable);
		}
		return result;
	}

	auto listEntries(const fs::path &dir,
					 EntryKind kind,
					 std::string_view pattern /* = "*" */,
					 Attributes filter /* = {} */)
		-> std::vector<fs::path>
	{
		auto result = std::vector<fs::path>{};
		for (const auto &entry : fs::directory_iterator(dir)) {
			const bool kindMatches = (kind == EntryKind::Directory) ? entry.is_directory()
																	: entry.is_regular_file();
			if (!kindMatches) {
				continue;
			}
			if (!matchesWildcard(entry.path().filename().string(), pattern)) {
				continue;
			}
			if (!filter.empty() && !attributesOf(entry.path()).containsAll(filter)) {
				continue;
			}
			result.push_back(entry.path());
		}
		return result;
	}

	bool anyEntry(const fs::path &dir, EntryKind kind, std::string_view pattern, bool recursive)
	{
		auto matches = [kind, pattern](const fs::directory_entry &entry) {
			const bool kindMatches = (kind == EntryKind::Directory) ? entry.is_directory()
																	: entry.is_regular_file();
			return kindMatches && matchesWildcard(entry.path().filename().string(), pattern);
		};

		if (recursive) {
			for (const auto &entry : fs::recursive_directory_iterator(dir)) {
				if (matches(entry)) {
					return true;
				}
			}
			return false;
		}
		for (const auto &entry : fs::directory_iterator(dir)) {
			if (matches(entry)) {
				return true;
			}
		}
		return false;
	}

	void clearReadOnly(const fs::path &path)
	{
		if (fs::is_symlink(fs::symlink_status(path))) {
			return;
		}
		fs::permissions(path, fs::perms::owner_write, fs::perm_options::add);
	}

	void clearReadOnlyRecursive(const fs::path &dir)
	{
		clearReadOnly(dir);
		for (const auto &entry : fs::recursive_directory_iterator(dir)) {
			clearReadOnly(entry.path());
		}
	}

	auto readBytes(const fs::path &path) -> Bytes
	{
		auto ifs = std::ifstream(path, std::ios::binary | std::ios::ate);
		if (!ifs) {
			throw std::runtime_error(fmt::format("Failed to open file: {}", path.string()));
		}
		const auto size = static_cast<std::streamsize>(ifs.tellg());
		ifs.seekg(0, std::ios::beg);

		auto buffer = Bytes(static_cast<size_t>(size));
		if (!ifs.read(reinterpret_cast<char *>(buffer.data()), size)) {
			throw std::runtime_error(fmt::format("Failed to read file: {}", path.string()));
		}
		return buffer;
	}

	void writeBytes(const fs::path &path, const Bytes &data, bool append /* = false */)
	{
		const auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
		auto ofs = std::ofstream(path, mode);
		if (!ofs) {
			throw std::runtime_error(fmt::format("Failed to open file for writing: {}", path.string()));
		}
		ofs.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
		if (!ofs) {
			throw std::runtime_error(fmt::format("Failed to write file: {}", path.string()));
		}
	}

	void moveFile(const fs::path &source, const fs::path &target)
	{
		auto error = std::error_code{};
		fs::rename(source, target, error);
		if (!error) {
			return;
		}
		if (error != std::errc::cross_device_link) {
			throw fs::filesystem_error("Cannot move file", source, target, error);
		}
		spdlog::debug("Cross-device move, copying \"{}\" to \"{}\"", source.string(), target.string());
		fs::copy_file(source, target, fs::copy_options::overwrite_existing);
		fs::remove(source);
	}
} // namespace fs_utils
