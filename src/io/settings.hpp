#pragma once

#include <optional>
#include <string_view>

namespace pathkit
{
	enum class Encoding { Utf8, Utf8Bom, Latin1 };
	enum class LineBreak { Unix, Windows };

	// Defaults applied by the text operations when a call does not override them.
	struct TextSettings
	{
		Encoding encoding{Encoding::Utf8};
		bool eofLineBreak{true};
		std::optional<LineBreak> lineBreak{}; // Host convention when empty
	};

	// Process-wide defaults. Meant to be configured once at startup; not synchronized.
	[[nodiscard]]
	auto textSettings() noexcept -> const TextSettings &;
	void configureTextSettings(const TextSettings &settings) noexcept;

	[[nodiscard]]
	constexpr auto hostLineBreak() noexcept -> LineBreak
	{
#ifdef _WIN32
		return LineBreak::Windows;
#else
		return LineBreak::Unix;
#endif
	}

	[[nodiscard]]
	constexpr auto lineTerminator(LineBreak lineBreak) noexcept -> std::string_view
	{
		return lineBreak == LineBreak::Windows ? "\r\n" : "\n";
	}

	// Terminator for an explicit choice, else the configured default, else the host one.
	[[nodiscard]]
	auto effectiveLineTerminator(std::optional<LineBreak> lineBreak = std::nullopt) noexcept
		-> std::string_view;

	[[nodiscard]]
	auto encodingByName(std::string_view name) noexcept -> std::optional<Encoding>;

	[[nodiscard]]
	auto lineBreakByName(std::string_view name) noexcept -> std::optional<LineBreak>;
} // namespace pathkit
