#include "pathkit/cli.hpp"

#include "io/absolute_path.hpp"
#include "io/directory_ops.hpp"
#include "io/errors.hpp"
#include "io/exists_policy.hpp"
#include "io/file_ops.hpp"
#include "io/path_syntax.hpp"
#include "io/settings.hpp"
#include "utils/filesystem.hpp"

#include <array>
#include <cstdlib>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <ranges>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ranges = std::ranges;

namespace pathkit::cli
{
	namespace
	{
		using Args = std::vector<std::string>;

		auto parseCmdLineArguments(int argc, char *argv[]) -> cxxopts::ParseResult
		{
			auto options = cxxopts::Options{"pathkit",
											"Rooted path arithmetic, hashing and file system helpers."};
			options.positional_help("<normalize|relative|hash|clean|copy|move|ls> [args...]");
			options.add_options()
				("h,help", "Print usage")
				("v,verbose", "Trace every file system mutation")
				("encoding", "Default text encoding: utf8, utf8-bom, latin1",
					cxxopts::value<std::string>()->default_value("utf8"))
				("eol", "Default line break: lf, crlf", cxxopts::value<std::string>())
				("no-eof-newline", "Do not terminate written text with a line break")
				("policy", "Conflict policy: fail, merge-skip, merge-overwrite, merge-overwrite-if-newer",
					cxxopts::value<std::string>()->default_value("fail"))
				("exclude", "Wildcard of file names left out of a directory hash", cxxopts::value<std::string>())
				("pattern", "Wildcard the listed names must match", cxxopts::value<std::string>()->default_value("*"))
				("depth", "Number of directory levels to list", cxxopts::value<int>()->default_value("1"))
				("dirs", "List directories instead of files")
				("command", "Command to run", cxxopts::value<std::string>())
				("args", "Command arguments", cxxopts::value<Args>());
			options.parse_positional({"command", "args"});

			options.allow_unrecognised_options();
			auto parsed = options.parse(argc, argv);

			const auto unmatched = parsed.unmatched();
			if (!unmatched.empty()) {
				fmt::print("Unrecognized command line argument(s): {}\n\n", unmatched);
				fmt::print("{}\n", options.help());
				exit(1);
			}
			if (parsed.count("help") || !parsed.count("command")) {
				fmt::print("{}\n", options.help());
				exit(parsed.count("help") ? 0 : 1);
			}
			return parsed;
		}

		void applySettings(const cxxopts::ParseResult &parsed)
		{
			if (parsed.count("verbose")) {
				spdlog::set_level(spdlog::level::debug);
			}

			auto settings = TextSettings{};
			const auto encodingName = parsed["encoding"].as<std::string>();
			const auto encoding = encodingByName(encodingName);
			if (!encoding.has_value()) {
				throw InvalidConfigurationError(fmt::format("Unknown encoding '{}'", encodingName));
			}
			settings.encoding = *encoding;

			if (parsed.count("eol")) {
				const auto eolName = parsed["eol"].as<std::string>();
				settings.lineBreak = lineBreakByName(eolName);
				if (!settings.lineBreak.has_value()) {
					throw InvalidConfigurationError(fmt::format("Unknown line break '{}'", eolName));
				}
			}
			settings.eofLineBreak = parsed.count("no-eof-newline") == 0;
			configureTextSettings(settings);
		}

		// Rooted arguments are taken as they are, anything else is resolved against the working directory.
		[[nodiscard]]
		auto toAbsolute(const std::string &arg) -> AbsolutePath
		{
			if (auto path = AbsolutePath::tryParse(arg)) {
				return *path;
			}
			return AbsolutePath::fromNative(fs::absolute(arg));
		}

		[[nodiscard]]
		auto selectedPolicy(const cxxopts::ParseResult &parsed) -> ExistsPolicy
		{
			const auto name = parsed["policy"].as<std::string>();
			if (const auto policy = policyByName(name)) {
				return *policy;
			}
			throw InvalidConfigurationError(fmt::format("Unknown policy '{}'", name));
		}

		void normalizeCmd(const Args &args, const cxxopts::ParseResult &)
		{
			fmt::print("{}\n", syntax::normalize(args[0]));
		}

		void relativeCmd(const Args &args, const cxxopts::ParseResult &)
		{
			const auto base = toAbsolute(args[0]);
			const auto dest = toAbsolute(args[1]);
			fmt::print("{}\n", dest.relativeTo(base));
		}

		void hashCmd(const Args &args, const cxxopts::ParseResult &parsed)
		{
			const auto path = toAbsolute(args[0]);
			if (!path.directory().exists()) {
				fmt::print("{}\n", path.file().getHash());
				return;
			}
			auto includeFile = PathPredicate{};
			if (parsed.count("exclude")) {
				includeFile = [exclude = parsed["exclude"].as<std::string>()](const AbsolutePath &file) {
					return !fs_utils::matchesWildcard(file.name(), exclude);
				};
			}
			fmt::print("{}\n", path.directory().getDirectoryHash(includeFile));
		}

		void cleanCmd(const Args &args, const cxxopts::ParseResult &)
		{
			const auto dir = toAbsolute(args[0]).directory().cleanAndRecreate();
			spdlog::info("Cleaned \"{}\"", dir.str());
		}

		void copyCmd(const Args &args, const cxxopts::ParseResult &parsed)
		{
			const auto source = toAbsolute(args[0]);
			const auto target = toAbsolute(args[1]);
			const auto policy = selectedPolicy(parsed);

			const auto result = source.directory().exists() ? source.directory().copy(target, policy)
															 : source.file().copy(target, policy);
			spdlog::info("Copied \"{}\" to \"{}\"", source.str(), result.str());
		}

		void moveCmd(const Args &args, const cxxopts::ParseResult &parsed)
		{
			const auto source = toAbsolute(args[0]);
			const auto target = toAbsolute(args[1]);
			const auto policy = selectedPolicy(parsed);

			const auto result = source.directory().exists() ? source.directory().move(target, policy)
															 : source.file().move(target, policy);
			spdlog::info("Moved \"{}\" to \"{}\"", source.str(), result.str());
		}

		void lsCmd(const Args &args, const cxxopts::ParseResult &parsed)
		{
			const auto dir = toAbsolute(args[0]).directory();
			if (!dir.exists()) {
				throw DirectoryNotFoundError(fmt::format("Directory '{}' not found", dir.path().str()));
			}
			const auto pattern = parsed["pattern"].as<std::string>();
			const auto depth = parsed["depth"].as<int>();

			if (parsed.count("dirs")) {
				for (const auto &subdir : dir.getDirectories(pattern, depth)) {
					fmt::print("{}\n", subdir.str());
				}
				return;
			}
			for (const auto &file : dir.getFiles(pattern, depth)) {
				fmt::print("{}\n", file.str());
			}
		}

		struct Command
		{
			std::string_view name;
			size_t argCount;
			void (*handler)(const Args &, const cxxopts::ParseResult &);
		};
		// clang-format off
		constexpr auto commands = std::to_array<Command> ({
			{"normalize", 1, normalizeCmd},
			{"relative",  2, relativeCmd},
			{"hash",      1, hashCmd},
			{"clean",     1, cleanCmd},
			{"copy",      2, copyCmd},
			{"move",      2, moveCmd},
			{"ls",        1, lsCmd}
		});
		// clang-format on
	} // namespace

	int run(int argc, char *argv[])
	{
		const auto parsed = parseCmdLineArguments(argc, argv);
		const auto name = parsed["command"].as<std::string>();
		const auto args = parsed.count("args") ? parsed["args"].as<Args>() : Args{};

		auto findCommand = [&name](const auto &lookup) -> bool { return lookup.name == name; };
		const auto command = ranges::find_if(commands, findCommand);
		if (command == commands.end()) {
			spdlog::error("Unknown command '{}'", name);
			return 1;
		}
		if (args.size() != command->argCount) {
			spdlog::error("'{}' expects {} argument(s), got {}", name, command->argCount, args.size());
			return 1;
		}

		try {
			applySettings(parsed);
			command->handler(args, parsed);
		} catch (const std::runtime_error &error) {
			// PathError, filesystem_error and stream failures alike
			spdlog::error("{}", error.what());
			return 1;
		}
		return 0;
	}
} // namespace pathkit::cli
