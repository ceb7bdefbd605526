#pragma once

#include "utils/filesystem.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // EVP_MD_CTX

namespace pathkit::hash
{
	constexpr size_t kDigestSize = 16;
	using Digest = std::array<std::uint8_t, kDigestSize>;

	// Streaming MD5. Used as a change-detection fingerprint, not for security.
	class Md5Stream
	{
	public:
		Md5Stream();
		~Md5Stream() = default;

		Md5Stream(const Md5Stream &) = delete;
		Md5Stream &operator=(const Md5Stream &) = delete;
		Md5Stream(Md5Stream &&) noexcept = default;
		Md5Stream &operator=(Md5Stream &&) noexcept = default;

		void update(std::span<const std::uint8_t> bytes);
		void update(std::string_view text);

		// Feeds the whole file through the digest in fixed-size blocks.
		void updateFromFile(const fs::path &file);

		// Finishes the digest. The stream cannot be updated afterwards.
		[[nodiscard]]
		auto finalize() -> Digest;

	private:
		struct ContextDeleter
		{
			void operator()(evp_md_ctx_st *ctx) const noexcept;
		};

		std::unique_ptr<evp_md_ctx_st, ContextDeleter> context;
		bool finalized{false};
	};

	[[nodiscard]]
	auto toHex(const Digest &digest) -> std::string;

	[[nodiscard]]
	auto fileHash(const fs::path &file) -> std::string;
} // namespace pathkit::hash
