#include "io/content_hash.hpp"

#include "io/errors.hpp"

#include <fmt/core.h>
#include <fstream>
#include <openssl/evp.h>
#include <vector>

namespace pathkit::hash
{
	namespace
	{
		constexpr std::streamsize kBlockSize = 64 * 1024;
	} // namespace

	void Md5Stream::ContextDeleter::operator()(evp_md_ctx_st *ctx) const noexcept
	{
		EVP_MD_CTX_free(ctx);
	}

	Md5Stream::Md5Stream()
		: context(EVP_MD_CTX_new())
	{
		if (!context) {
			throw InvalidConfigurationError("Unable to allocate an MD5 context");
		}
		if (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1) {
			throw InvalidConfigurationError("Unable to initialize the MD5 digest");
		}
	}

	void Md5Stream::update(std::span<const std::uint8_t> bytes)
	{
		if (!context || finalized) {
			throw InvalidConfigurationError("MD5 stream is no longer accepting data");
		}
		if (bytes.empty()) {
			return;
		}
		if (EVP_DigestUpdate(context.get(), bytes.data(), bytes.size()) != 1) {
			throw InvalidConfigurationError("Unable to update the MD5 digest");
		}
	}

	void Md5Stream::update(std::string_view text)
	{
		update(std::span(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
	}

	void Md5Stream::updateFromFile(const fs::path &file)
	{
		auto ifs = std::ifstream(file, std::ios::binary);
		if (!ifs) {
			throw FileNotFoundError(fmt::format("Unable to open '{}' for hashing", file.string()));
		}
		auto buffer = std::vector<char>(kBlockSize);
		while (ifs) {
			ifs.read(buffer.data(), kBlockSize);
			const auto bytesRead = ifs.gcount();
			if (bytesRead <= 0) {
				break;
			}
			update(std::span(reinterpret_cast<const std::uint8_t *>(buffer.data()),
							 static_cast<size_t>(bytesRead)));
		}
		if (ifs.bad()) {
			throw std::runtime_error(fmt::format("Failed to read '{}' while hashing", file.string()));
		}
	}

	auto Md5Stream::finalize() -> Digest
	{
		if (!context || finalized) {
			throw InvalidConfigurationError("MD5 digest was already finalized");
		}
		auto digest = Digest{};
		unsigned int length = 0;
		if (EVP_DigestFinal_ex(context.get(), digest.data(), &length) != 1 || length != kDigestSize) {
			throw InvalidConfigurationError("The MD5 hash could not be calculated");
		}
		finalized = true;
		return digest;
	}

	auto toHex(const Digest &digest) -> std::string
	{
		auto result = std::string{};
		result.reserve(digest.size() * 2);
		for (const auto byte : digest) {
			result += fmt::format("{:02x}", byte);
		}
		return result;
	}

	auto fileHash(const fs::path &file) -> std::string
	{
		auto md5 = Md5Stream{};
		md5.updateFromFile(file);
		return toHex(md5.finalize());
	}
} // namespace pathkit::hash
