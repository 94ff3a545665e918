#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"

#include <string>
#include <vector>

TEST_CASE("join_path treats empty and slash parents as the root") {
    CHECK(Utils::join_path("", "docs") == "docs");
    CHECK(Utils::join_path("/", "docs") == "docs");
    CHECK(Utils::join_path("root/a", "b") == "root/a/b");
}

TEST_CASE("parent_path and base_name split on the last separator") {
    CHECK(Utils::parent_path("root/a/b.txt") == "root/a");
    CHECK(Utils::parent_path("root").empty());
    CHECK(Utils::parent_path("/top").empty());
    CHECK(Utils::base_name("root/a/b.txt") == "b.txt");
    CHECK(Utils::base_name("root") == "root");
}

TEST_CASE("ancestor_chain lists ancestors below the root") {
    using Chain = std::vector<std::string>;
    CHECK(Utils::ancestor_chain("root/a/b/c", "root") == Chain{"root/a", "root/a/b"});
    CHECK(Utils::ancestor_chain("root/a/b/c", "root/a") == Chain{"root/a/b"});
    CHECK(Utils::ancestor_chain("docs/guide/intro.md", "") == Chain{"docs", "docs/guide"});
    CHECK(Utils::ancestor_chain("/home/user/file", "/home") == Chain{"/home/user"});
    CHECK(Utils::ancestor_chain("root", "root").empty());
}

TEST_CASE("is_same_or_descendant respects segment boundaries") {
    CHECK(Utils::is_same_or_descendant("root/a", "root"));
    CHECK(Utils::is_same_or_descendant("root", "root"));
    CHECK_FALSE(Utils::is_same_or_descendant("rooted/a", "root"));
    CHECK_FALSE(Utils::is_same_or_descendant("root", "root/a"));
    CHECK(Utils::is_same_or_descendant("anything", ""));
}

TEST_CASE("replace_prefix rewrites the leading segments") {
    CHECK(Utils::replace_prefix("root/a/b", "root/a", "root/z") == "root/z/b");
    CHECK(Utils::replace_prefix("root/a", "root/a", "root/z") == "root/z");
}

TEST_CASE("trim_copy and is_blank handle whitespace") {
    CHECK(Utils::trim_copy("  hello \t") == "hello");
    CHECK(Utils::trim_copy("   ").empty());
    CHECK(Utils::is_blank(" \n\t"));
    CHECK(Utils::is_blank(""));
    CHECK_FALSE(Utils::is_blank(" x "));
}

TEST_CASE("utf8 path conversion round trips non ascii names") {
    const std::string name = "caf\xC3\xA9/notes";
    CHECK(Utils::path_to_utf8(Utils::utf8_to_path(name)) == name);
}
