#ifndef FOCUS_NAVIGATOR_HPP
#define FOCUS_NAVIGATOR_HPP

#include "ExpansionStore.hpp"
#include "HierarchySource.hpp"
#include "TreeErrors.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

struct BreadcrumbItem {
    std::string name;
    std::string path;
};

struct FocusHistoryEntry {
    std::optional<std::string> path; ///< nullopt means the hierarchy root.
    ExpansionStore::Snapshot expanded;
    std::int64_t timestamp{0};
};

/**
 * @brief Shifts a pane's effective root to any folder and back.
 *
 * Every successful focus_on() records the previous focus and expansion
 * snapshot; go_back()/go_forward() move between recorded states. The back
 * stack is bounded and drops its oldest entry when full.
 */
class FocusNavigator {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 50;

    FocusNavigator(const HierarchySource& source,
                   ExpansionStore& expansion,
                   std::size_t history_limit = kDefaultHistoryLimit);

    TreeOperationResult focus_on(const std::string& path);
    void unfocus();
    bool go_back();
    bool go_forward();

    bool is_focused() const { return focused_path_.has_value(); }
    bool can_go_back() const { return !back_.empty(); }
    bool can_go_forward() const { return !forward_.empty(); }

    const std::optional<std::string>& focused_path() const { return focused_path_; }
    const std::vector<BreadcrumbItem>& breadcrumb() const { return breadcrumb_; }
    const std::deque<FocusHistoryEntry>& history() const { return back_; }
    const std::deque<FocusHistoryEntry>& forward_history() const { return forward_; }

    /// Focused folder, or the hierarchy root when unfocused or the focus vanished.
    EntryPtr effective_root();

    void apply_change(const ChangeNotice& notice);

    /// Everything the navigator holds, taken before a change that may be undone.
    struct Snapshot {
        std::optional<std::string> focused_path;
        std::vector<BreadcrumbItem> breadcrumb;
        std::deque<FocusHistoryEntry> back;
        std::deque<FocusHistoryEntry> forward;
    };

    Snapshot snapshot() const { return Snapshot{focused_path_, breadcrumb_, back_, forward_}; }
    void restore(Snapshot snapshot);

    /// Reinstates persisted state; an unresolvable focus or the root is dropped.
    void restore(const std::optional<std::string>& focused_path,
                 std::deque<FocusHistoryEntry> history);

    void set_history_limit(std::size_t limit);
    std::size_t history_limit() const { return history_limit_; }

private:
    FocusHistoryEntry capture() const;
    void apply(const FocusHistoryEntry& entry);
    void push_bounded(std::deque<FocusHistoryEntry>& stack, FocusHistoryEntry entry);
    void rebuild_breadcrumb();
    bool resolves_to_container(const std::string& path) const;

    const HierarchySource& source_;
    ExpansionStore& expansion_;
    std::size_t history_limit_;
    std::optional<std::string> focused_path_;
    std::vector<BreadcrumbItem> breadcrumb_;
    std::deque<FocusHistoryEntry> back_;
    std::deque<FocusHistoryEntry> forward_;
};

#endif
