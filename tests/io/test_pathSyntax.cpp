#include <doctest/doctest.h>
#include "io/errors.hpp"
#include "io/path_syntax.hpp"

#include <array>
#include <string>

using namespace pathkit;

TEST_CASE("syntax: root detection") {
	CHECK(syntax::isWindowsRoot("C:"));
	CHECK(syntax::isWindowsRoot("z:"));
	CHECK_FALSE(syntax::isWindowsRoot("1:"));
	CHECK_FALSE(syntax::isWindowsRoot("C:\\"));
	CHECK(syntax::isUnixRoot("/"));
	CHECK_FALSE(syntax::isUnixRoot("//"));

	CHECK(syntax::getRoot("/usr/lib") == "/");
	CHECK(syntax::getRoot("C:\\Windows") == "C:");
	CHECK(syntax::getRoot("d:") == "d:");
	CHECK_FALSE(syntax::getRoot("").has_value());
	CHECK_FALSE(syntax::getRoot("relative/path").has_value());
	CHECK_FALSE(syntax::getRoot("C").has_value());

	CHECK(syntax::hasWindowsRoot("C:/mixed"));
	CHECK(syntax::hasUnixRoot("/"));
	CHECK_FALSE(syntax::hasRoot("./a"));

	CHECK(syntax::separatorOf("C:\\a") == syntax::kWindowsSeparator);
	CHECK(syntax::separatorOf("/a") == syntax::kUnixSeparator);
	CHECK(syntax::separatorOf("a/b") == syntax::hostSeparator());
}

TEST_CASE("syntax: normalize") {
	SUBCASE("collapses dot segments") {
		CHECK(syntax::normalize("/a/b/../c") == "/a/c");
		CHECK(syntax::normalize("/a/./b/") == "/a/b");
		CHECK(syntax::normalize("/a//b///c") == "/a/b/c");
		CHECK(syntax::normalize("/a/..") == "/");
		CHECK(syntax::normalize("/") == "/");
	}
	SUBCASE("windows roots use backslashes") {
		CHECK(syntax::normalize("C:/a//b\\") == "C:\\a\\b");
		CHECK(syntax::normalize("C:") == "C:\\");
		CHECK(syntax::normalize("C:\\") == "C:\\");
		CHECK(syntax::normalize("C:\\dir\\..") == "C:\\");
	}
	SUBCASE("relative paths keep leading parent segments") {
		CHECK(syntax::normalize("../a/../b", '/') == "../b");
		CHECK(syntax::normalize("a/b/../../..", '/') == "..");
		CHECK(syntax::normalize("./a/b", '\\') == "a\\b");
		CHECK(syntax::normalize("") == "");
	}
	SUBCASE("rooted paths cannot leave the root") {
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("/..")), RootBoundaryError);
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("/../a")), RootBoundaryError);
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("C:\\..\\a")), RootBoundaryError);
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("/a/../..")), RootBoundaryError);
	}
	SUBCASE("separator must agree with the root") {
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("/a", '\\')), SeparatorConflictError);
		CHECK_THROWS_AS(static_cast<void>(syntax::normalize("C:\\a", '/')), SeparatorConflictError);
		CHECK(syntax::normalize("/a/b", '/') == "/a/b");
	}
}

TEST_CASE("syntax: normalize is idempotent") {
	constexpr auto paths = std::to_array<std::string_view>({
		"/a/b/../c/", "C:/x/./y", "D:", "/", "../up/./down", "a\\b/c", "/a/b/c/../../d"
	});
	for (const auto path : paths) {
		CAPTURE(path);
		const auto once = syntax::normalize(path, syntax::hasRoot(path) ? std::nullopt : std::optional('/'));
		CHECK(syntax::normalize(once, syntax::hasRoot(once) ? std::nullopt : std::optional('/')) == once);
	}
}

TEST_CASE("syntax: combine") {
	CHECK(syntax::combine("C:", "foo") == "C:\\foo");
	CHECK(syntax::combine("C:\\", "foo") == "C:\\foo");
	CHECK(syntax::combine("C:\\foo\\", "bar") == "C:\\foo\\bar");
	CHECK(syntax::combine("/", "a") == "/a");
	CHECK(syntax::combine("/a/", "b/") == "/a/b");
	CHECK(syntax::combine("a", "b", '/') == "a/b");
	CHECK(syntax::combine("", "b") == "b");
	CHECK(syntax::combine("/a", "") == "/a");
	CHECK(syntax::combine("C:", "") == "C:\\");

	CHECK_THROWS_AS(static_cast<void>(syntax::combine("/a", "/b")), MalformedPathError);
	CHECK_THROWS_AS(static_cast<void>(syntax::combine("/a", "C:\\b")), MalformedPathError);
	CHECK_THROWS_AS(static_cast<void>(syntax::combine("C:", "b", '/')), SeparatorConflictError);
}

TEST_CASE("syntax: combine keeps the left root") {
	constexpr auto lefts = std::to_array<std::string_view>({"/", "/usr", "C:", "C:\\Program Files"});
	constexpr auto rights = std::to_array<std::string_view>({"x", "x/y", "x\\y\\"});
	for (const auto left : lefts) {
		for (const auto right : rights) {
			const auto combined = syntax::combine(left, right);
			CHECK(syntax::getRoot(combined) == syntax::getRoot(left));
		}
	}
}

TEST_CASE("syntax: relativeTo") {
	CHECK(syntax::relativeTo("/a/b", "/a/c/d") == "../c/d");
	CHECK(syntax::relativeTo("/a/b", "/a/b/c") == "c");
	CHECK(syntax::relativeTo("/a/b", "/a/b") == "");
	CHECK(syntax::relativeTo("/a/b/c", "/a") == "../..");
	CHECK(syntax::relativeTo("/", "/etc/hosts") == "etc/hosts");
	CHECK(syntax::relativeTo("C:\\Work\\src", "C:\\Work\\bin\\app.exe") == "..\\bin\\app.exe");

	SUBCASE("windows segments ignore case") {
		CHECK(syntax::relativeTo("C:\\A\\b", "c:\\a\\B\\c") == "c");
	}
	SUBCASE("unix segments are case-sensitive") {
		CHECK(syntax::relativeTo("/A", "/a/b") == "../a/b");
	}
	SUBCASE("mismatched roots") {
		CHECK_THROWS_AS(static_cast<void>(syntax::relativeTo("/a", "C:\\a")), SeparatorConflictError);
		CHECK_THROWS_AS(static_cast<void>(syntax::relativeTo("C:\\a", "D:\\a")), SeparatorConflictError);
		CHECK_THROWS_AS(static_cast<void>(syntax::relativeTo("C:\\", "C:\\a")), SeparatorConflictError);
	}
}

TEST_CASE("syntax: relativeTo then combine returns the destination") {
	struct Pair
	{
		std::string_view base;
		std::string_view dest;
	};
	constexpr auto pairs = std::to_array<Pair>({
		{"/a/b", "/a/c/d"},
		{"/a/b/c", "/x"},
		{"/a", "/a/b/c"},
		{"C:\\a\\b", "C:\\a\\z"}
	});
	for (const auto &[base, dest] : pairs) {
		CAPTURE(base);
		const auto relative = syntax::relativeTo(base, dest);
		CHECK(syntax::normalize(syntax::combine(base, relative)) == dest);
	}
}

TEST_CASE("syntax: combine then relativeTo returns the suffix") {
	struct Pair
	{
		std::string_view base;
		std::string_view sub;
	};
	constexpr auto pairs = std::to_array<Pair>({
		{"/a/b", "c"},
		{"/", "etc/hosts"},
		{"C:\\Work", "src\\main.cpp"}
	});
	for (const auto &[base, sub] : pairs) {
		CAPTURE(base);
		CHECK(syntax::relativeTo(base, syntax::combine(base, sub)) == sub);
	}
}

TEST_CASE("syntax: case-insensitive helpers") {
	CHECK(syntax::equalsIgnoreCase("C:\\Dir", "c:\\dIR"));
	CHECK_FALSE(syntax::equalsIgnoreCase("abc", "abcd"));
	CHECK(syntax::endsWithIgnoreCase("archive.TAR.GZ", ".gz"));
	CHECK_FALSE(syntax::endsWithIgnoreCase("gz", ".gz"));
}
