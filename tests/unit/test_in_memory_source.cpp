#include <catch2/catch_test_macros.hpp>
#include "InMemoryHierarchySource.hpp"
#include "TreeErrors.hpp"

#include <vector>

TEST_CASE("adding a nested file creates its folders and notifies each") {
    InMemoryHierarchySource source("root");
    std::vector<ChangeNotice> notices;
    source.add_change_listener([&notices](const ChangeNotice& notice) { notices.push_back(notice); });

    REQUIRE(source.add_file("root/a/b/c.txt", 42, 7));
    REQUIRE(notices.size() == 3);
    CHECK(notices[0].path == "root/a");
    CHECK(notices[1].path == "root/a/b");
    CHECK(notices[2].path == "root/a/b/c.txt");
    CHECK(source.is_container("root/a/b"));
    CHECK(source.resolve("root/a/b/c.txt")->size == 42);
    CHECK(source.entry_count() == 4);
}

TEST_CASE("duplicate, foreign and file-parented entries are rejected") {
    InMemoryHierarchySource source("root");
    REQUIRE(source.add_file("root/file.txt"));
    CHECK_FALSE(source.add_file("root/file.txt"));
    CHECK_FALSE(source.add_folder("elsewhere/x"));
    CHECK_FALSE(source.add_file("root/file.txt/child"));
}

TEST_CASE("children keep insertion order") {
    InMemoryHierarchySource source("root");
    source.add_folder("root/z");
    source.add_folder("root/a");
    const auto children = source.children("root");
    REQUIRE(children.size() == 2);
    CHECK(children[0]->name == "z");
    CHECK(children[1]->name == "a");
}

TEST_CASE("remove drops the whole subtree") {
    InMemoryHierarchySource source("root");
    source.add_file("root/a/b/c.txt");
    std::vector<ChangeNotice> notices;
    source.add_change_listener([&notices](const ChangeNotice& notice) { notices.push_back(notice); });

    REQUIRE(source.remove("root/a"));
    CHECK(source.resolve("root/a/b/c.txt") == nullptr);
    CHECK(source.children("root").empty());
    REQUIRE(notices.size() == 1);
    CHECK(notices.front().type == ChangeType::Delete);
    CHECK_FALSE(source.remove("root"));
}

TEST_CASE("rename moves the subtree and reports the old path") {
    InMemoryHierarchySource source("root");
    source.add_file("root/a/b/c.txt");
    source.add_folder("root/target");
    std::vector<ChangeNotice> notices;
    const auto token = source.add_change_listener(
        [&notices](const ChangeNotice& notice) { notices.push_back(notice); });

    REQUIRE(source.rename("root/a", "root/target/a2"));
    CHECK(source.resolve("root/target/a2/b/c.txt") != nullptr);
    CHECK(source.resolve("root/a") == nullptr);
    REQUIRE(notices.size() == 1);
    CHECK(notices.front().type == ChangeType::Rename);
    CHECK(notices.front().old_path == std::optional<std::string>("root/a"));

    CHECK_FALSE(source.rename("root/target", "root/target/inner"));
    CHECK_FALSE(source.rename("root/target", "root/missing/x"));

    source.remove_change_listener(token);
    source.add_folder("root/quiet");
    CHECK(notices.size() == 1);
}

TEST_CASE("unreadable containers throw on listing") {
    InMemoryHierarchySource source("root");
    source.add_folder("root/locked");
    source.set_unreadable("root/locked");
    CHECK_THROWS_AS(source.children("root/locked"), SourceUnavailableError);
    source.set_unreadable("root/locked", false);
    CHECK(source.children("root/locked").empty());
    CHECK_THROWS_AS(source.children("root/none"), SourceUnavailableError);
}
