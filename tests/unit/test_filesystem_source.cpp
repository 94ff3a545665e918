#include <catch2/catch_test_macros.hpp>
#include "ExpansionStore.hpp"
#include "FilesystemHierarchySource.hpp"
#include "FocusNavigator.hpp"
#include "FolderCountCache.hpp"
#include "TestHelpers.hpp"
#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>

namespace {
std::vector<std::string> sorted_names(const std::vector<EntryPtr>& entries)
{
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry->name);
    }
    std::sort(names.begin(), names.end());
    return names;
}
}

TEST_CASE("hidden files require explicit flag") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".secret.txt");

    FilesystemHierarchySource source(temp_dir.path(), FileScanOptions::Files);
    REQUIRE(source.children("").empty());

    FilesystemHierarchySource with_hidden(temp_dir.path(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    const auto entries = with_hidden.children("");
    REQUIRE(entries.size() == 1);
    CHECK(entries.front()->name == ".secret.txt");
    CHECK(entries.front()->type == NodeType::File);
}

TEST_CASE("junk files are skipped regardless of flags") {
    TempDir temp_dir;
    write_file(temp_dir.path() / ".DS_Store");
    write_file(temp_dir.path() / "Thumbs.db");

    FilesystemHierarchySource source(temp_dir.path(),
        FileScanOptions::Files | FileScanOptions::HiddenFiles);
    REQUIRE(source.children("").empty());
}

TEST_CASE("children use relative slash separated paths") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "docs" / "guide" / "intro.md", "hello");
    write_file(temp_dir.path() / "readme.txt");

    FilesystemHierarchySource source(temp_dir.path());
    CHECK(source.root()->path.empty());
    CHECK(source.root()->is_container());
    CHECK(sorted_names(source.children("")) == std::vector<std::string>{"docs", "readme.txt"});

    const auto guide = source.children("docs");
    REQUIRE(guide.size() == 1);
    CHECK(guide.front()->path == "docs/guide");
    CHECK(guide.front()->is_container());

    const auto files = source.children("docs/guide");
    REQUIRE(files.size() == 1);
    CHECK(files.front()->path == "docs/guide/intro.md");
    CHECK(files.front()->size == 5);
    CHECK(files.front()->modified_time > 0);
}

TEST_CASE("directory only scans leave files out") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt");
    std::filesystem::create_directories(temp_dir.path() / "folder");

    FilesystemHierarchySource source(temp_dir.path(), FileScanOptions::Directories);
    CHECK(sorted_names(source.children("")) == std::vector<std::string>{"folder"});
}

TEST_CASE("resolve finds entries and rejects missing ones") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "docs" / "intro.md");

    FilesystemHierarchySource source(temp_dir.path());
    const auto folder = source.resolve("docs");
    REQUIRE(folder);
    CHECK(folder->is_container());
    CHECK(source.is_container("docs"));
    CHECK_FALSE(source.is_container("docs/intro.md"));
    CHECK(source.resolve("docs/intro.md")->name == "intro.md");
    CHECK(source.resolve("nowhere") == nullptr);
}

TEST_CASE("listing a vanished folder throws a source error") {
    TempDir temp_dir;
    std::filesystem::create_directories(temp_dir.path() / "gone");
    FilesystemHierarchySource source(temp_dir.path());
    std::filesystem::remove(temp_dir.path() / "gone");

    try {
        source.children("gone");
        FAIL("expected SourceUnavailableError");
    } catch (const SourceUnavailableError& ex) {
        CHECK(ex.path() == "gone");
    }
}

TEST_CASE("paths leaving the root directory do not resolve") {
    TempDir temp_dir;
    const auto root_dir = temp_dir.path() / "root";
    write_file(root_dir / "inside" / "a.txt");
    write_file(temp_dir.path() / "outside" / "secret.txt");

    FilesystemHierarchySource source(root_dir);
    CHECK(source.resolve("..") == nullptr);
    CHECK(source.resolve("../outside") == nullptr);
    CHECK(source.resolve("inside/../../outside") == nullptr);
    CHECK(source.resolve(Utils::path_to_utf8(temp_dir.path())) == nullptr);
    CHECK(source.resolve("./inside") == nullptr);
    CHECK(source.resolve("inside") != nullptr);

    CHECK_THROWS_AS(source.children("../outside"), SourceUnavailableError);
    CHECK_THROWS_AS(source.children(Utils::path_to_utf8(temp_dir.path() / "outside")),
                    SourceUnavailableError);

    ExpansionStore expansion(source.root()->path);
    FocusNavigator focus(source, expansion);
    const auto result = focus.focus_on("../outside");
    CHECK(result.code == TreeErrorCode::InvalidFocusTarget);
    CHECK_FALSE(focus.is_focused());
    CHECK(focus.focus_on("/").code == TreeErrorCode::None);
    CHECK_FALSE(focus.focus_on(Utils::path_to_utf8(temp_dir.path())).success);
    CHECK_FALSE(focus.is_focused());
}

TEST_CASE("directory links are neither listed nor followed") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "A" / "file.txt");
    std::error_code ec;
    std::filesystem::create_directory_symlink(temp_dir.path(), temp_dir.path() / "A" / "up", ec);
    if (ec) {
        SKIP("directory links are not supported here: " << ec.message());
    }

    FilesystemHierarchySource source(temp_dir.path());
    CHECK(sorted_names(source.children("A")) == std::vector<std::string>{"file.txt"});
    CHECK(source.resolve("A/up") == nullptr);
    CHECK(source.resolve("A/up/A") == nullptr);
    CHECK_THROWS_AS(source.children("A/up"), SourceUnavailableError);

    FolderCountCache counts(source);
    counts.compute_counts();
    CHECK(counts.size() == 2);
    const auto root_counts = counts.get("");
    REQUIRE(root_counts);
    CHECK(root_counts->recursive_folder_count == 1);
    CHECK(root_counts->recursive_file_count == 1);

    ExpansionStore expansion("");
    CHECK(expansion.expand_all(source, *source.root(), 50) == 1);
    CHECK(expansion.to_list() == std::vector<std::string>{"A"});
}
