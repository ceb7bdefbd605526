#include <doctest/doctest.h>
#include "io/absolute_path.hpp"
#include "io/errors.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace pathkit;

TEST_CASE("AbsolutePath: construction requires a root") {
	CHECK(AbsolutePath("/a/../b/").str() == "/b");
	CHECK(AbsolutePath("C:/Users//me").str() == "C:\\Users\\me");
	CHECK(AbsolutePath("C:").str() == "C:\\");

	CHECK_THROWS_AS(AbsolutePath("relative/path"), MalformedPathError);
	CHECK_THROWS_AS(AbsolutePath(""), MalformedPathError);
	CHECK_THROWS_AS(AbsolutePath("/.."), RootBoundaryError);

	CHECK_FALSE(AbsolutePath::tryParse("relative").has_value());
	CHECK_FALSE(AbsolutePath::tryParse("/..").has_value());
	REQUIRE(AbsolutePath::tryParse("/tmp/./x").has_value());
	CHECK(AbsolutePath::tryParse("/tmp/./x")->str() == "/tmp/x");

	CHECK(AbsolutePath::fromNative(fs::path("/var/log/../tmp")).str() == "/var/tmp");
	CHECK(AbsolutePath("/etc/hosts").native() == fs::path("/etc/hosts"));
}

TEST_CASE("AbsolutePath: equality") {
	SUBCASE("windows paths ignore case") {
		CHECK(AbsolutePath("C:\\Foo\\Bar") == AbsolutePath("c:\\foo\\BAR"));
		CHECK(AbsolutePath("C:\\Foo").hash() == AbsolutePath("c:\\FOO").hash());
	}
	SUBCASE("windows hashing folds case without copying") {
		const auto longPath = AbsolutePath("C:\\Program Files\\Vendor\\Product\\Resources\\Settings.ini");
		static_assert(noexcept(longPath.hash()));
		CHECK(longPath.hash() == AbsolutePath("c:\\PROGRAM FILES\\vendor\\product\\resources\\settings.INI").hash());
		CHECK(AbsolutePath("C:\\a").hash() != AbsolutePath("C:\\b").hash());
	}
	SUBCASE("unix paths are ordinal") {
		CHECK(AbsolutePath("/Foo") != AbsolutePath("/foo"));
	}
	SUBCASE("different roots never match") {
		CHECK(AbsolutePath("/a") != AbsolutePath("C:\\a"));
	}
	SUBCASE("usable as a hash key") {
		const auto set = std::unordered_set<AbsolutePath>{AbsolutePath("D:\\Data"), AbsolutePath("d:\\data")};
		CHECK(set.size() == 1);
	}
}

TEST_CASE("AbsolutePath: ordering") {
	auto paths = std::vector<AbsolutePath>{AbsolutePath("/b"), AbsolutePath("/a/z"), AbsolutePath("/a")};
	std::ranges::sort(paths);
	CHECK(paths == std::vector<AbsolutePath>{AbsolutePath("/a"), AbsolutePath("/a/z"), AbsolutePath("/b")});

	CHECK(AbsolutePath("C:\\alpha") < AbsolutePath("c:\\BETA"));
}

TEST_CASE("AbsolutePath: name and parent") {
	const auto path = AbsolutePath("/home/user/notes.txt");
	CHECK(path.name() == "notes.txt");
	REQUIRE(path.parent().has_value());
	CHECK(path.parent()->str() == "/home/user");

	CHECK(AbsolutePath("/home").parent()->str() == "/");
	CHECK(AbsolutePath("C:\\Windows").parent()->str() == "C:\\");
	CHECK(AbsolutePath("C:\\Windows\\System32").name() == "System32");

	SUBCASE("roots") {
		CHECK(AbsolutePath("/").isRoot());
		CHECK(AbsolutePath("C:\\").isRoot());
		CHECK_FALSE(AbsolutePath("/").parent().has_value());
		CHECK_FALSE(AbsolutePath("E:").parent().has_value());
		CHECK(AbsolutePath("/").name().empty());
	}
	SUBCASE("walking up reaches the root") {
		auto current = std::optional(AbsolutePath("/a/b/c"));
		auto steps = 0;
		while (current->parent().has_value()) {
			current = current->parent();
			++steps;
		}
		CHECK(steps == 3);
		CHECK(current->str() == "/");
	}
}

TEST_CASE("AbsolutePath: combine and concat") {
	const auto base = AbsolutePath("/srv/app");

	CHECK((base / "logs").str() == "/srv/app/logs");
	CHECK((base / "logs/../cache/").str() == "/srv/app/cache");
	CHECK(base.combine("..").str() == "/srv");
	CHECK(combine(base, "x\\y").str() == "/srv/app/x/y");
	CHECK((AbsolutePath("C:") / "tools").str() == "C:\\tools");

	CHECK((base + ".bak").str() == "/srv/app.bak");
	CHECK(concatRaw(base, "2/data").str() == "/srv/app2/data");

	CHECK_THROWS_AS(static_cast<void>(base / "/etc"), MalformedPathError);
	CHECK_THROWS_AS(static_cast<void>(AbsolutePath("/a") / "../.."), RootBoundaryError);
}

TEST_CASE("AbsolutePath: relativeTo") {
	CHECK(AbsolutePath("/srv/app/bin").relativeTo(AbsolutePath("/srv/lib")) == "../app/bin");
	CHECK(AbsolutePath("/srv").relativeTo(AbsolutePath("/srv")).empty());
	CHECK_THROWS_AS(static_cast<void>(AbsolutePath("/srv").relativeTo(AbsolutePath("C:\\srv"))),
					SeparatorConflictError);
}
