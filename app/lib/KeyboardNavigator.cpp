#include "KeyboardNavigator.hpp"

#include <algorithm>

std::optional<std::size_t> KeyboardNavigator::index_of(const std::vector<FlatRow>& rows,
                                                       const std::string& path)
{
    const auto it = std::find_if(rows.begin(), rows.end(),
                                 [&path](const FlatRow& row) { return row.path == path; });
    if (it == rows.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(rows.begin(), it));
}

std::optional<std::size_t> KeyboardNavigator::resolve(const std::vector<FlatRow>& rows,
                                                      const std::optional<std::string>& current_path,
                                                      const NavigationMove& move)
{
    if (rows.empty()) {
        return std::nullopt;
    }
    const std::size_t last = rows.size() - 1;
    const std::size_t page = std::max<std::size_t>(1, move.page_size);

    if (move.kind == MoveKind::First) return 0;
    if (move.kind == MoveKind::Last) return last;

    const auto current = current_path ? index_of(rows, *current_path) : std::nullopt;
    if (!current) {
        switch (move.kind) {
            case MoveKind::Next:
            case MoveKind::PageForward:
                return 0;
            case MoveKind::Prev:
            case MoveKind::PageBackward:
                return last;
            default:
                return std::nullopt;
        }
    }

    const std::size_t index = *current;
    switch (move.kind) {
        case MoveKind::Next:
            if (index >= last) return std::nullopt;
            return index + 1;
        case MoveKind::Prev:
            if (index == 0) return std::nullopt;
            return index - 1;
        case MoveKind::PageForward:
            return std::min(index + page, last);
        case MoveKind::PageBackward:
            return index > page ? index - page : 0;
        case MoveKind::Parent: {
            const std::string& parent = rows[index].parent_path;
            for (std::size_t i = index; i-- > 0;) {
                if (rows[i].path == parent) {
                    return i;
                }
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

std::optional<ScrollRequest> KeyboardNavigator::scroll_into_view(std::size_t index, const VirtualWindow& window)
{
    if (window.is_visible(index)) {
        return std::nullopt;
    }
    return ScrollRequest{index, ScrollAlign::Center};
}
