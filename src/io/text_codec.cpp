#include "io/text_codec.hpp"

#include <algorithm>
#include <array>

namespace pathkit::text
{
	namespace
	{
		constexpr auto kUtf8Bom = std::to_array<std::uint8_t>({0xEF, 0xBB, 0xBF});
		constexpr std::uint8_t kLatin1Replacement = '?';

		[[nodiscard]]
		bool startsWithBom(std::span<const std::uint8_t> bytes) noexcept
		{
			return bytes.size() >= kUtf8Bom.size()
				&& std::equal(kUtf8Bom.begin(), kUtf8Bom.end(), bytes.begin());
		}

		// Length of the UTF-8 sequence introduced by 'lead', 0 for an invalid lead byte.
		[[nodiscard]]
		size_t sequenceLength(std::uint8_t lead) noexcept
		{
			if (lead < 0x80) {
				return 1;
			}
			if ((lead & 0xE0) == 0xC0) {
				return 2;
			}
			if ((lead & 0xF0) == 0xE0) {
				return 3;
			}
			if ((lead & 0xF8) == 0xF0) {
				return 4;
			}
			return 0;
		}

		[[nodiscard]]
		auto toLatin1(std::string_view text) -> Bytes
		{
			auto result = Bytes{};
			result.reserve(text.size());

			size_t i = 0;
			while (i < text.size()) {
				const auto lead = static_cast<std::uint8_t>(text[i]);
				const auto length = sequenceLength(lead);
				if (length == 0 || i + length > text.size()) {
					result.push_back(kLatin1Replacement);
					++i;
					continue;
				}
				if (length == 1) {
					result.push_back(lead);
				} else if (length == 2) {
					const auto cont = static_cast<std::uint8_t>(text[i + 1]);
					const unsigned codePoint = ((lead & 0x1Fu) << 6) | (cont & 0x3Fu);
					result.push_back(codePoint <= 0xFF ? static_cast<std::uint8_t>(codePoint)
													   : kLatin1Replacement);
				} else {
					result.push_back(kLatin1Replacement);
				}
				i += length;
			}
			return result;
		}

		[[nodiscard]]
		auto fromLatin1(std::span<const std::uint8_t> bytes) -> std::string
		{
			auto result = std::string{};
			result.reserve(bytes.size());
			for (const auto byte : bytes) {
				if (byte < 0x80) {
					result.push_back(static_cast<char>(byte));
				} else {
					result.push_back(static_cast<char>(0xC0 | (byte >> 6)));
					result.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
				}
			}
			return result;
		}
	} // namespace

	auto encode(std::string_view text, Encoding encoding, bool withPreamble /* = true */) -> Bytes
	{
		if (encoding == Encoding::Latin1) {
			return toLatin1(text);
		}
		auto result = Bytes{};
		result.reserve(text.size() + kUtf8Bom.size());
		if (encoding == Encoding::Utf8Bom && withPreamble) {
			result.insert(result.end(), kUtf8Bom.begin(), kUtf8Bom.end());
		}
		result.insert(result.end(), text.begin(), text.end());
		return result;
	}

	auto decode(std::span<const std::uint8_t> bytes, Encoding encoding) -> std::string
	{
		if (encoding == Encoding::Latin1) {
			return fromLatin1(bytes);
		}
		if (startsWithBom(bytes)) {
			bytes = bytes.subspan(kUtf8Bom.size());
		}
		return {bytes.begin(), bytes.end()};
	}

	auto splitLines(std::string_view text) -> Lines
	{
		auto lines = Lines{};
		size_t start = 0;
		size_t i = 0;
		while (i < text.size()) {
			const char c = text[i];
			if (c != '\n' && c != '\r') {
				++i;
				continue;
			}
			lines.emplace_back(text.substr(start, i - start));
			i += (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
			start = i;
		}
		if (start < text.size()) {
			lines.emplace_back(text.substr(start));
		}
		return lines;
	}

	auto joinLines(const Lines &lines, std::string_view terminator) -> std::string
	{
		auto result = std::string{};
		for (size_t i = 0; i < lines.size(); ++i) {
			if (i > 0) {
				result.append(terminator);
			}
			result.append(lines[i]);
		}
		return result;
	}

	auto withSingleEofLineBreak(std::string_view text) -> std::string
	{
		const bool windowsLineBreaks = text.find("\r\n") != std::string_view::npos;
		while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
			text.remove_suffix(1);
		}
		auto result = std::string(text);
		result.append(windowsLineBreaks ? "\r\n" : "\n");
		return result;
	}
} // namespace pathkit::text
