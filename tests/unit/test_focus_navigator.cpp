#include <catch2/catch_test_macros.hpp>
#include "ExpansionStore.hpp"
#include "FocusNavigator.hpp"
#include "TestHelpers.hpp"

#include <unordered_set>

namespace {
/// Wraps a source and pretends some paths no longer resolve.
class HidingSource : public HierarchySource {
public:
    explicit HidingSource(const HierarchySource& inner) : inner_(inner) {}

    EntryPtr root() const override { return inner_.root(); }
    EntryPtr resolve(const std::string& path) const override
    {
        return hidden_.contains(path) ? nullptr : inner_.resolve(path);
    }
    std::vector<EntryPtr> children(const std::string& path) const override
    {
        return inner_.children(path);
    }

    void hide(const std::string& path) { hidden_.insert(path); }

private:
    const HierarchySource& inner_;
    std::unordered_set<std::string> hidden_;
};

std::vector<std::string> crumb_names(const FocusNavigator& navigator)
{
    std::vector<std::string> names;
    for (const auto& item : navigator.breadcrumb()) {
        names.push_back(item.name);
    }
    return names;
}
}

TEST_CASE("focusing then going back restores the root and expansion") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    expansion.expand("root/B");
    const auto before = expansion.snapshot();

    REQUIRE(navigator.focus_on("root/A"));
    CHECK(navigator.focused_path() == std::optional<std::string>("root/A"));
    CHECK(navigator.effective_root()->path == "root/A");
    expansion.expand("root/A/Sub");
    expansion.collapse("root/B");

    REQUIRE(navigator.go_back());
    CHECK_FALSE(navigator.focused_path().has_value());
    CHECK(navigator.effective_root()->path == "root");
    CHECK(expansion.snapshot() == before);
    CHECK(navigator.can_go_forward());
}

TEST_CASE("go_forward returns to the state left by go_back") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A"));
    expansion.expand("root/A/Sub");
    REQUIRE(navigator.go_back());
    CHECK_FALSE(expansion.is_expanded("root/A/Sub"));

    REQUIRE(navigator.go_forward());
    CHECK(navigator.focused_path() == std::optional<std::string>("root/A"));
    CHECK(expansion.is_expanded("root/A/Sub"));
    CHECK_FALSE(navigator.go_forward());
}

TEST_CASE("a new focus clears the forward history") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A"));
    REQUIRE(navigator.go_back());
    REQUIRE(navigator.can_go_forward());
    REQUIRE(navigator.focus_on("root/B"));
    CHECK_FALSE(navigator.can_go_forward());
}

TEST_CASE("files and missing paths cannot be focused") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    const auto file_result = navigator.focus_on("root/notes.txt");
    CHECK_FALSE(file_result.success);
    CHECK(file_result.code == TreeErrorCode::InvalidFocusTarget);

    const auto missing = navigator.focus_on("root/nowhere");
    CHECK(missing.code == TreeErrorCode::InvalidFocusTarget);
    CHECK_FALSE(navigator.is_focused());
    CHECK_FALSE(navigator.can_go_back());
}

TEST_CASE("refocusing the focused folder records nothing") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A"));
    REQUIRE(navigator.focus_on("root/A"));
    CHECK(navigator.history().size() == 1);
}

TEST_CASE("history drops the oldest entries beyond its limit") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion, 3);

    for (const char* path : {"root/A", "root/A/Sub", "root/B", "root/item2", "root/item10"}) {
        REQUIRE(navigator.focus_on(path));
    }
    REQUIRE(navigator.history().size() == 3);
    CHECK(navigator.history().front().path == std::optional<std::string>("root/A/Sub"));
    CHECK(navigator.history().back().path == std::optional<std::string>("root/item2"));
}

TEST_CASE("breadcrumb lists the folders from the root to the focus") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A/Sub"));
    CHECK(crumb_names(navigator) == std::vector<std::string>{"A", "Sub"});
    CHECK(navigator.breadcrumb().back().path == "root/A/Sub");

    navigator.unfocus();
    CHECK(navigator.breadcrumb().empty());
}

TEST_CASE("breadcrumb stops at the first segment that no longer resolves") {
    InMemoryHierarchySource inner("root");
    inner.add_folder("root/A/Sub/Deeper");
    HidingSource source(inner);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    source.hide("root/A/Sub");
    REQUIRE(navigator.focus_on("root/A/Sub/Deeper"));
    CHECK(crumb_names(navigator) == std::vector<std::string>{"A"});
}

TEST_CASE("effective root falls back when the focused folder disappears") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A/Sub"));
    source.remove("root/A");
    CHECK(navigator.effective_root()->path == "root");
    CHECK_FALSE(navigator.is_focused());
}

TEST_CASE("renames rewrite the focus and the history") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    REQUIRE(navigator.focus_on("root/A"));
    REQUIRE(navigator.focus_on("root/A/Sub"));
    source.rename("root/A", "root/Renamed");
    const ChangeNotice notice{ChangeType::Rename, "root/Renamed", std::string("root/A")};
    navigator.apply_change(notice);

    CHECK(navigator.focused_path() == std::optional<std::string>("root/Renamed/Sub"));
    CHECK(crumb_names(navigator) == std::vector<std::string>{"Renamed", "Sub"});
    CHECK(navigator.history().back().path == std::optional<std::string>("root/Renamed"));

    navigator.apply_change(ChangeNotice{ChangeType::Delete, "root/Renamed", std::nullopt});
    CHECK_FALSE(navigator.is_focused());
}

TEST_CASE("restore reinstates persisted focus and trims history") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion, 2);

    std::deque<FocusHistoryEntry> history;
    for (int i = 0; i < 4; ++i) {
        history.push_back(FocusHistoryEntry{std::nullopt, {}, i});
    }
    navigator.restore(std::string("root/B"), history);
    CHECK(navigator.focused_path() == std::optional<std::string>("root/B"));
    REQUIRE(navigator.history().size() == 2);
    CHECK(navigator.history().front().timestamp == 2);

    navigator.restore(std::string("root/gone"), {});
    CHECK_FALSE(navigator.is_focused());
}

TEST_CASE("focusing the hierarchy root returns to the unfocused view") {
    InMemoryHierarchySource source("root");
    populate_sample_hierarchy(source);
    ExpansionStore expansion("root");
    FocusNavigator navigator(source, expansion);

    const auto noop = navigator.focus_on("root");
    CHECK(noop.success);
    CHECK(noop.affected_items == 0);
    CHECK_FALSE(navigator.is_focused());
    CHECK_FALSE(navigator.can_go_back());

    REQUIRE(navigator.focus_on("root/A"));
    const auto back_to_root = navigator.focus_on("root");
    CHECK(back_to_root.affected_items == 1);
    CHECK_FALSE(navigator.is_focused());
    CHECK(navigator.breadcrumb().empty());

    REQUIRE(navigator.go_back());
    CHECK(navigator.focused_path() == std::optional<std::string>("root/A"));

    navigator.restore(std::optional<std::string>("root"), {});
    CHECK_FALSE(navigator.is_focused());
}
