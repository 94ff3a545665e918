#include <catch2/catch_test_macros.hpp>
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>

TEST_CASE("config path honors the override directory") {
    TempDir temp_dir;
    EnvVarGuard config_guard("DUALPANE_TREE_CONFIG_DIR", temp_dir.path().string());

    Settings settings;
    const auto expected = temp_dir.path() / "DualPaneTree" / "config.ini";
    CHECK(std::filesystem::path(settings.get_config_path()) == expected);
    CHECK(std::filesystem::exists(settings.get_config_dir()));
}

TEST_CASE("missing config file yields defaults") {
    TempDir temp_dir;
    EnvVarGuard config_guard("DUALPANE_TREE_CONFIG_DIR", temp_dir.path().string());

    Settings settings;
    CHECK_FALSE(settings.load());
    const PaneConfig left = settings.get_pane_config(PaneId::Left);
    CHECK_FALSE(left.show_files_in_tree);
    CHECK(left.max_render_depth == 50);
    CHECK(left.sort_by == SortCriterion::Name);
    CHECK(left.search_debounce_ms == 300);
    CHECK(left.change_debounce_ms == 100);
    CHECK(settings.get_active_pane() == PaneId::Left);
}

TEST_CASE("pane settings persist across save and load") {
    TempDir temp_dir;
    EnvVarGuard config_guard("DUALPANE_TREE_CONFIG_DIR", temp_dir.path().string());

    {
        Settings settings;
        PaneConfig right;
        right.show_files_in_tree = true;
        right.max_render_depth = 12;
        right.sort_by = SortCriterion::Size;
        right.case_sensitive_search = true;
        right.search_mode = SearchMode::Glob;
        right.search_debounce_ms = 150;
        right.change_debounce_ms = 0;
        right.max_focus_history = 20;
        right.expand_all_depth = 4;
        settings.set_pane_config(PaneId::Right, right);
        settings.set_active_pane(PaneId::Right);
        REQUIRE(settings.save());
    }

    Settings reloaded;
    REQUIRE(reloaded.load());
    const PaneConfig right = reloaded.get_pane_config(PaneId::Right);
    CHECK(right.show_files_in_tree);
    CHECK(right.max_render_depth == 12);
    CHECK(right.sort_by == SortCriterion::Size);
    CHECK(right.case_sensitive_search);
    CHECK(right.search_mode == SearchMode::Glob);
    CHECK(right.search_debounce_ms == 150);
    CHECK(right.change_debounce_ms == 0);
    CHECK(right.max_focus_history == 20);
    CHECK(right.expand_all_depth == 4);
    CHECK(reloaded.get_active_pane() == PaneId::Right);
    CHECK_FALSE(reloaded.get_pane_config(PaneId::Left).show_files_in_tree);
}

TEST_CASE("invalid values in the config file fall back to defaults") {
    TempDir temp_dir;
    EnvVarGuard config_guard("DUALPANE_TREE_CONFIG_DIR", temp_dir.path().string());

    Settings settings;
    {
        std::ofstream out(settings.get_config_path());
        out << "; hand edited\n"
            << "[LeftPane]\n"
            << "MaxRenderDepth = lots\n"
            << "SortBy = colour\n"
            << "ShowFilesInTree = maybe\n"
            << "SearchDebounceMs = 999999\n"
            << "MaxFocusHistory = -4\n";
    }
    REQUIRE(settings.load());
    const PaneConfig left = settings.get_pane_config(PaneId::Left);
    CHECK(left.max_render_depth == 50);
    CHECK(left.sort_by == SortCriterion::Name);
    CHECK_FALSE(left.show_files_in_tree);
    CHECK(left.search_debounce_ms == 10000);
    CHECK(left.max_focus_history == 50);
}
