#include <doctest/doctest.h>
#include "io/content_hash.hpp"
#include "io/errors.hpp"
#include "../common/temp_dir.hpp"

using namespace pathkit;

namespace
{
	constexpr auto kEmptyMd5 = "d41d8cd98f00b204e9800998ecf8427e";
	constexpr auto kAbcMd5 = "900150983cd24fb0d6963f7d28e17f72";
} // namespace

TEST_CASE("hash: md5 stream") {
	SUBCASE("empty input") {
		auto md5 = hash::Md5Stream{};
		CHECK(hash::toHex(md5.finalize()) == kEmptyMd5);
	}
	SUBCASE("chunking does not matter") {
		auto whole = hash::Md5Stream{};
		whole.update("abc");

		auto pieces = hash::Md5Stream{};
		pieces.update("a");
		pieces.update("");
		pieces.update("bc");

		const auto digest = whole.finalize();
		CHECK(hash::toHex(digest) == kAbcMd5);
		CHECK(pieces.finalize() == digest);
	}
	SUBCASE("finalized streams reject further use") {
		auto md5 = hash::Md5Stream{};
		static_cast<void>(md5.finalize());
		CHECK_THROWS_AS(md5.update("x"), InvalidConfigurationError);
		CHECK_THROWS_AS(static_cast<void>(md5.finalize()), InvalidConfigurationError);
	}
}

TEST_CASE("hash: toHex") {
	auto digest = hash::Digest{};
	digest[0] = 0x0A;
	digest[15] = 0xFF;
	CHECK(hash::toHex(digest) == "0a0000000000000000000000000000ff");
}

TEST_CASE("hash: file content") {
	const auto tmpDir = TempDir();
	const auto abc = tmpDir.writeFile("abc.txt", "abc");
	const auto empty = tmpDir.writeFile("empty.txt", "");

	CHECK(hash::fileHash(abc.native()) == kAbcMd5);
	CHECK(hash::fileHash(empty.native()) == kEmptyMd5);

	SUBCASE("large files are read in blocks") {
		const auto big = tmpDir.writeFile("big.bin", std::string(200 * 1024, 'x'));
		auto md5 = hash::Md5Stream{};
		md5.update(std::string(200 * 1024, 'x'));
		CHECK(hash::fileHash(big.native()) == hash::toHex(md5.finalize()));
	}
	SUBCASE("missing file") {
		CHECK_THROWS_AS(static_cast<void>(hash::fileHash(tmpDir.path / "nope")), FileNotFoundError);
	}
}
