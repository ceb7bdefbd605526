#pragma once

#include "io/settings.hpp"
#include "utils/filesystem.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pathkit::text
{
	using Bytes = fs_utils::Bytes;
	using Lines = std::vector<std::string>;

	// UTF-8 text to bytes in 'encoding'. 'withPreamble' controls the BOM of Utf8Bom.
	[[nodiscard]]
	auto encode(std::string_view text, Encoding encoding, bool withPreamble = true) -> Bytes;

	// Bytes in 'encoding' to UTF-8 text. A leading UTF-8 BOM is dropped for both UTF-8 kinds.
	[[nodiscard]]
	auto decode(std::span<const std::uint8_t> bytes, Encoding encoding) -> std::string;

	// Splits on "\r\n", "\n" and "\r". A trailing terminator does not open an extra line.
	[[nodiscard]]
	auto splitLines(std::string_view text) -> Lines;

	[[nodiscard]]
	auto joinLines(const Lines &lines, std::string_view terminator) -> std::string;

	// Drops every trailing CR/LF and appends a single terminator, CRLF if the text used it.
	[[nodiscard]]
	auto withSingleEofLineBreak(std::string_view text) -> std::string;
} // namespace pathkit::text
