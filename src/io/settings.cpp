#include "io/settings.hpp"

#include <array>
#include <ranges>

namespace ranges = std::ranges;

namespace pathkit
{
	namespace
	{
		TextSettings gTextSettings{};

		struct EncodingName
		{
			Encoding encoding;
			std::string_view name;
		};
		// clang-format off
		constexpr auto encodingNames = std::to_array<EncodingName> ({
			{Encoding::Utf8,    "utf8"},
			{Encoding::Utf8,    "utf-8"},
			{Encoding::Utf8Bom, "utf8-bom"},
			{Encoding::Utf8Bom, "utf-8-bom"},
			{Encoding::Latin1,  "latin1"},
			{Encoding::Latin1,  "iso-8859-1"}
		});
		// clang-format on
	} // namespace

	auto textSettings() noexcept -> const TextSettings &
	{
		return gTextSettings;
	}

	void configureTextSettings(const TextSettings &settings) noexcept
	{
		gTextSettings = settings;
	}

	auto effectiveLineTerminator(std::optional<LineBreak> lineBreak /* = std::nullopt */) noexcept
		-> std::string_view
	{
		if (!lineBreak.has_value()) {
			lineBreak = textSettings().lineBreak;
		}
		return lineTerminator(lineBreak.value_or(hostLineBreak()));
	}

	auto encodingByName(std::string_view name) noexcept -> std::optional<Encoding>
	{
		auto findName = [name](const auto &lookup) -> bool { return lookup.name == name; };

		if (const auto it = ranges::find_if(encodingNames, findName); it != encodingNames.end()) {
			return it->encoding;
		}
		return std::nullopt;
	}

	auto lineBreakByName(std::string_view name) noexcept -> std::optional<LineBreak>
	{
		if (name == "lf" || name == "unix") {
			return LineBreak::Unix;
		}
		if (name == "crlf" || name == "windows") {
			return LineBreak::Windows;
		}
		return std::nullopt;
	}
} // namespace pathkit
