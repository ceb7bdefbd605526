#pragma once

#include "io/absolute_path.hpp"
#include "utils/filesystem.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

struct TempDir
{
	fs::path path;
	TempDir()
	{
		path = fs::temp_directory_path() / ("pkTests_" + randomString(8));
		if (fs::exists(path)) {
			fs::remove_all(path);
		}
		fs::create_directories(path);
	}
	~TempDir()
	{
		auto error = std::error_code{};
		fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, error);
		fs::remove_all(path, error);
	}

	[[nodiscard]]
	auto root() const -> pathkit::AbsolutePath { return pathkit::AbsolutePath::fromNative(path); }

	// Writes 'content' to 'relative', creating the intermediate directories.
	auto writeFile(std::string_view relative, std::string_view content) const -> pathkit::AbsolutePath
	{
		const auto file = path / relative;
		fs::create_directories(file.parent_path());
		std::ofstream(file, std::ios::binary) << content;
		return pathkit::AbsolutePath::fromNative(file);
	}

	[[nodiscard]]
	auto readFile(std::string_view relative) const -> std::string
	{
		auto ifs = std::ifstream(path / relative, std::ios::binary);
		return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
	}

	static std::string randomString(size_t length)
	{
		const auto chars = "0123456789abcdef";
		auto rndDevice = std::random_device();
		auto generator = std::mt19937(rndDevice());
		auto distribution = std::uniform_int_distribution(0, 15);
		auto result = std::string();
		for (size_t i = 0; i < length; ++i) {
			result += chars[distribution(generator)];
		}
		return result;
	}
};
