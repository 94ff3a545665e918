#ifndef KEYBOARD_NAVIGATOR_HPP
#define KEYBOARD_NAVIGATOR_HPP

#include "Flattener.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class MoveKind {Next, Prev, First, Last, PageForward, PageBackward, Parent};

struct NavigationMove {
    MoveKind kind{MoveKind::Next};
    std::size_t page_size{1};

    static NavigationMove next() { return {MoveKind::Next, 1}; }
    static NavigationMove prev() { return {MoveKind::Prev, 1}; }
    static NavigationMove first() { return {MoveKind::First, 1}; }
    static NavigationMove last() { return {MoveKind::Last, 1}; }
    static NavigationMove page_forward(std::size_t rows) { return {MoveKind::PageForward, rows}; }
    static NavigationMove page_backward(std::size_t rows) { return {MoveKind::PageBackward, rows}; }
    static NavigationMove parent() { return {MoveKind::Parent, 1}; }
};

enum class ScrollAlign {Center};

struct ScrollRequest {
    std::size_t index{0};
    ScrollAlign align{ScrollAlign::Center};
};

/**
 * @brief Maps directional input onto indices of a flattened row list.
 *
 * Pure functions; nothing here touches selection or expansion state.
 */
class KeyboardNavigator {
public:
    static std::optional<std::size_t> resolve(const std::vector<FlatRow>& rows,
                                              const std::optional<std::string>& current_path,
                                              const NavigationMove& move);

    static std::optional<std::size_t> index_of(const std::vector<FlatRow>& rows, const std::string& path);

    /// A centered scroll, only when @p index lies outside the visible rows.
    static std::optional<ScrollRequest> scroll_into_view(std::size_t index, const VirtualWindow& window);
};

#endif
