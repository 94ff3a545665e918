#include <catch2/catch_test_macros.hpp>
#include "ExpansionStore.hpp"
#include "Flattener.hpp"
#include "SearchEngine.hpp"
#include "SortEngine.hpp"
#include "TestHelpers.hpp"
#include "TreeBuilder.hpp"

namespace {
struct FlattenFixture {
    QtAppContext context;
    InMemoryHierarchySource source{"root"};
    SortEngine sorter;
    SearchEngine search;
    ExpansionStore expansion{"root"};

    std::vector<FlatRow> rows(bool include_files, const std::string& query = {})
    {
        TreeBuilder builder(source, sorter, search);
        BuildOptions options;
        options.include_files = include_files;
        options.expansion = &expansion;
        options.search_query = query;
        auto result = builder.build(source.root(), options);
        return Flattener::project(*result.root);
    }
};
}

TEST_CASE("expanded folder rows are followed by their children") {
    FlattenFixture fixture;
    fixture.source.add_file("root/A/x.md");
    fixture.source.add_file("root/A/y.md");
    fixture.source.add_folder("root/B");
    fixture.expansion.expand("root/A");

    const auto with_files = fixture.rows(true);
    CHECK(row_labels(with_files) == std::vector<std::string>{"A", "x.md", "y.md", "B"});
    CHECK(with_files[0].level == 0);
    CHECK(with_files[1].level == 1);
    CHECK(with_files[1].parent_path == "root/A");
    CHECK(with_files[0].is_expanded);

    const auto folders_only = fixture.rows(false);
    CHECK(row_labels(folders_only) == std::vector<std::string>{"A", "B"});
}

TEST_CASE("virtual indices follow row order") {
    FlattenFixture fixture;
    populate_sample_hierarchy(fixture.source);
    fixture.expansion.expand_all(fixture.source, *fixture.source.root());

    const auto rows = fixture.rows(true);
    REQUIRE(rows.size() == 9);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        CHECK(rows[i].virtual_index == i);
    }
    CHECK(row_paths(rows).front() == "root/A");
    CHECK(row_paths(rows)[1] == "root/A/Sub");
    CHECK(row_paths(rows)[2] == "root/A/Sub/deep.txt");
}

TEST_CASE("collapsed branches contribute a single row") {
    FlattenFixture fixture;
    populate_sample_hierarchy(fixture.source);
    fixture.expansion.expand("root/A/Sub");

    const auto rows = fixture.rows(true);
    CHECK(row_labels(rows) == std::vector<std::string>{"A", "B", "item2", "item10", "notes.txt"});
    CHECK(rows.front().has_children);
    CHECK_FALSE(rows.front().is_expanded);
}

TEST_CASE("rows carry search scores only for direct matches") {
    FlattenFixture fixture;
    populate_sample_hierarchy(fixture.source);

    const auto rows = fixture.rows(true, "p.txt");
    CHECK(row_paths(rows) == std::vector<std::string>{"root/A", "root/A/Sub", "root/A/Sub/deep.txt"});
    CHECK_FALSE(rows[0].search_score.has_value());
    REQUIRE(rows[2].search_score.has_value());
    CHECK(*rows[2].search_score == SearchEngine::kSubstringScore);
}

TEST_CASE("flatten skips the effective root") {
    FlattenFixture fixture;
    TreeBuilder builder(fixture.source, fixture.sorter, fixture.search);
    auto result = builder.build(fixture.source.root(), {});
    CHECK(Flattener::flatten(*result.root).empty());
}

TEST_CASE("window covers the viewport plus overscan") {
    const auto window = Flattener::compute_window(100, 200.0, 100.0, 20.0, 3);
    CHECK_FALSE(window.empty);
    CHECK(window.first_visible == 10);
    CHECK(window.last_visible == 14);
    CHECK(window.start == 7);
    CHECK(window.end == 17);
    CHECK(window.is_visible(12));
    CHECK_FALSE(window.is_visible(15));
}

TEST_CASE("window clamps at the list edges") {
    const auto top = Flattener::compute_window(10, 0.0, 100.0, 20.0, 5);
    CHECK(top.start == 0);
    CHECK(top.first_visible == 0);
    CHECK(top.last_visible == 4);
    CHECK(top.end == 9);

    const auto past_end = Flattener::compute_window(10, 1000.0, 100.0, 20.0, 5);
    CHECK(past_end.first_visible == 9);
    CHECK(past_end.last_visible == 9);

    CHECK(Flattener::compute_window(0, 0.0, 100.0, 20.0).empty);
    CHECK(Flattener::compute_window(10, 0.0, 0.0, 20.0).empty);
}
