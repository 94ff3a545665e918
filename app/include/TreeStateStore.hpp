#ifndef TREE_STATE_STORE_HPP
#define TREE_STATE_STORE_HPP

#include "FocusNavigator.hpp"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

/// Persisted view state of one pane.
struct PaneState {
    std::vector<std::string> expanded_folders;
    std::optional<std::string> focused_folder;
    std::optional<std::string> selected_folder;
    SortCriterion sort_by{SortCriterion::Name};
    bool show_files_in_tree{false};
    int max_render_depth{50};
    std::string search_query;
    std::deque<FocusHistoryEntry> focus_history;
    std::int64_t last_updated{0};
};

/**
 * @brief Reads and writes tree-state-<pane>.json in the config directory.
 *
 * A missing file, a parse error or a schema mismatch yields default state;
 * the latter two are logged as warnings.
 */
class TreeStateStore {
public:
    static constexpr int kSchemaVersion = 1;

    TreeStateStore(std::string config_dir, PaneId pane);

    PaneState load() const;
    bool save(const PaneState& state) const;

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
};

#endif
