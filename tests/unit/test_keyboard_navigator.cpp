#include <catch2/catch_test_macros.hpp>
#include "KeyboardNavigator.hpp"

namespace {
FlatRow make_row(const std::string& path, const std::string& parent, int level)
{
    FlatRow row;
    row.path = path;
    row.parent_path = parent;
    row.label = path.substr(path.find_last_of('/') + 1);
    row.level = level;
    row.type = NodeType::Folder;
    return row;
}

std::vector<FlatRow> sample_rows()
{
    return {
        make_row("root/A", "root", 0),
        make_row("root/A/One", "root/A", 1),
        make_row("root/A/One/Deep", "root/A/One", 2),
        make_row("root/A/Two", "root/A", 1),
        make_row("root/B", "root", 0),
    };
}

std::optional<std::string> at(const std::vector<FlatRow>& rows, std::optional<std::size_t> index)
{
    if (!index) {
        return std::nullopt;
    }
    return rows[*index].path;
}
}

TEST_CASE("next and prev step one row and stop at the ends") {
    const auto rows = sample_rows();
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A"), NavigationMove::next()) == 1u);
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/Two"), NavigationMove::prev()) == 2u);
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::string("root/B"), NavigationMove::next()).has_value());
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::string("root/A"), NavigationMove::prev()).has_value());
}

TEST_CASE("unknown selection starts from the matching end") {
    const auto rows = sample_rows();
    CHECK(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::next()) == 0u);
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/gone"), NavigationMove::page_forward(3)) == 0u);
    CHECK(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::prev()) == 4u);
    CHECK(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::page_backward(3)) == 4u);
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::parent()).has_value());
}

TEST_CASE("first and last ignore the selection") {
    const auto rows = sample_rows();
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/Two"), NavigationMove::first()) == 0u);
    CHECK(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::last()) == 4u);
}

TEST_CASE("page moves clamp to the list bounds") {
    const auto rows = sample_rows();
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/One"), NavigationMove::page_forward(2)) == 3u);
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/One"), NavigationMove::page_forward(10)) == 4u);
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/Two"), NavigationMove::page_backward(10)) == 0u);
    CHECK(KeyboardNavigator::resolve(rows, std::string("root/A/Two"), NavigationMove::page_backward(0)) == 2u);
}

TEST_CASE("parent move jumps to the nearest parent row above") {
    const auto rows = sample_rows();
    CHECK(at(rows, KeyboardNavigator::resolve(rows, std::string("root/A/One/Deep"), NavigationMove::parent())) ==
          std::optional<std::string>("root/A/One"));
    CHECK(at(rows, KeyboardNavigator::resolve(rows, std::string("root/A/Two"), NavigationMove::parent())) ==
          std::optional<std::string>("root/A"));
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::string("root/B"), NavigationMove::parent()).has_value());
}

TEST_CASE("an empty list resolves nothing") {
    const std::vector<FlatRow> rows;
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::nullopt, NavigationMove::first()).has_value());
    CHECK_FALSE(KeyboardNavigator::resolve(rows, std::string("x"), NavigationMove::next()).has_value());
}

TEST_CASE("scroll requests only target rows outside the viewport") {
    VirtualWindow window;
    window.empty = false;
    window.first_visible = 10;
    window.last_visible = 20;

    CHECK_FALSE(KeyboardNavigator::scroll_into_view(15, window).has_value());
    const auto below = KeyboardNavigator::scroll_into_view(25, window);
    REQUIRE(below.has_value());
    CHECK(below->index == 25);
    CHECK(below->align == ScrollAlign::Center);
    CHECK(KeyboardNavigator::scroll_into_view(0, VirtualWindow{}).has_value());
}
