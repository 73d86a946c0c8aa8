#include "test_common.hpp"

using namespace pathmon;

TEST_CASE("strip_path splits at the top-level directory") {
    StrippedPath s = strip_path("/opt/app/bin/app");
    REQUIRE(s.prefix == fs::path("/opt"));
    REQUIRE(s.tail == fs::path("app/bin/app"));

    StrippedPath two = strip_path("/opt/app");
    REQUIRE(two.prefix == fs::path("/opt"));
    REQUIRE(two.tail == fs::path("app"));
}

TEST_CASE("strip_path watches the root for single components") {
    StrippedPath s = strip_path("/vmlinuz");
    REQUIRE(s.prefix == fs::path("/"));
    REQUIRE(s.tail == fs::path("vmlinuz"));

    StrippedPath root = strip_path("/");
    REQUIRE(root.prefix == fs::path("/"));
    REQUIRE(root.tail.empty());
}

TEST_CASE("strip_path requires a root") {
    REQUIRE_THROWS_AS(strip_path("relative/path"), std::invalid_argument);
}

TEST_CASE("strip_paths skips paths it cannot split") {
    std::set<fs::path> resolved{"/a/b/c", "/a/d", "x/y"};
    auto stripped = strip_paths(resolved);
    REQUIRE(stripped.size() == 3);
    REQUIRE(stripped.count(StrippedPath{"/a", "b/c"}) == 1);
    REQUIRE(stripped.count(StrippedPath{"/a", "d"}) == 1);
    REQUIRE(stripped.count(StrippedPath{"/", "a"}) == 1);
}

TEST_CASE("strip_paths guards top-level directories from the root") {
    std::set<fs::path> resolved{"/alias/file.txt", "/opt/app/bin", "/vmlinuz"};
    auto stripped = strip_paths(resolved);
    std::set<StrippedPath> expected{{"/alias", "file.txt"}, {"/", "alias"},
                                    {"/opt", "app/bin"},    {"/", "opt"},
                                    {"/", "vmlinuz"}};
    REQUIRE(stripped == expected);

    // A change record naming the top-level entry matches its root entry.
    REQUIRE(tail_matches(fs::path("alias"), fs::path("alias")));
    REQUIRE_FALSE(tail_matches(fs::path("alias"), fs::path("aliases")));
}

TEST_CASE("tail_matches compares names textually") {
    fs::path tail = strip_path("/tmp/A/B/file.txt").tail;
    REQUIRE(tail_matches(tail, strip_path("/tmp/A").tail));
    REQUIRE(tail_matches(tail, strip_path("/tmp/A/B").tail));
    REQUIRE(tail_matches(tail, tail));
    REQUIRE(tail_matches(tail, fs::path()));
    REQUIRE_FALSE(tail_matches(tail, strip_path("/tmp/A/C").tail));
    REQUIRE_FALSE(tail_matches(tail, strip_path("/tmp/A/B/file.txt.bak").tail));

    // A longer sibling name sharing the prefix still counts.
    fs::path other = strip_path("/tmp/A/Bc/file.txt").tail;
    REQUIRE(tail_matches(other, strip_path("/tmp/A/B").tail));
}
