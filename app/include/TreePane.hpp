#ifndef TREE_PANE_HPP
#define TREE_PANE_HPP

#include "DebouncedTrigger.hpp"
#include "ExpansionStore.hpp"
#include "Flattener.hpp"
#include "FocusNavigator.hpp"
#include "FolderCountCache.hpp"
#include "HierarchySource.hpp"
#include "KeyboardNavigator.hpp"
#include "SearchEngine.hpp"
#include "Settings.hpp"
#include "SortEngine.hpp"
#include "TreeBuilder.hpp"
#include "TreeErrors.hpp"
#include "TreeNode.hpp"
#include "TreeStateStore.hpp"
#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One pane's tree: expansion, focus, search, selection and the
 * flattened rows a renderer draws.
 *
 * Every mutation ends in a rebuild. A rebuild either replaces the rows
 * completely or, when it throws, leaves the previous rows in place and
 * undoes the mutation.
 * Search edits and change notices are debounced with the intervals from
 * PaneConfig.
 */
class TreePane {
public:
    using RowsChangedCallback = std::function<void(const std::vector<FlatRow>&)>;

    TreePane(PaneId id,
             const HierarchySource& source,
             const PaneConfig& config = {},
             const FolderCountCache* counts = nullptr);

    TreePane(const TreePane&) = delete;
    TreePane& operator=(const TreePane&) = delete;

    TreeOperationResult refresh();

    TreeOperationResult toggle_expand(const std::string& path);
    TreeOperationResult expand_all();
    TreeOperationResult collapse_all();
    TreeOperationResult reveal_path(const std::string& path);

    void set_sort_criterion(SortCriterion criterion);
    void set_include_files(bool include_files);
    void set_max_render_depth(int depth);
    void set_search_options(const SearchOptions& options);
    void set_config(const PaneConfig& config);

    /// Debounced; the rows follow once the query settles or flush_pending() runs.
    void set_search_query(const std::string& query);

    TreeOperationResult focus_on(const std::string& path);
    void unfocus();
    bool go_back();
    bool go_forward();

    std::optional<std::size_t> navigate(const NavigationMove& move);
    bool select(const std::string& path);
    bool expand_selected();
    bool collapse_selected();

    void notify_change(const ChangeNotice& notice);
    void flush_pending();

    void set_viewport(double viewport_height, double row_height);
    void set_scroll_offset(double scroll_offset);
    VirtualWindow window() const;

    std::vector<SearchHit> search_hits(std::size_t max_results = 100) const;

    PaneState capture_state() const;
    TreeOperationResult restore_state(const PaneState& state);

    void set_rows_changed_callback(RowsChangedCallback callback) { rows_changed_ = std::move(callback); }
    void set_count_cache(const FolderCountCache* counts) { builder_.set_count_cache(counts); }

    PaneId id() const { return id_; }
    const std::vector<FlatRow>& rows() const { return rows_; }
    const std::vector<BreadcrumbItem>& breadcrumb_trail() const { return focus_.breadcrumb(); }
    const std::optional<std::string>& selected_path() const { return selected_; }
    const std::optional<ScrollRequest>& scroll_request() const { return scroll_request_; }
    void clear_scroll_request() { scroll_request_.reset(); }
    const TreeNode* tree() const { return tree_.get(); }
    const BuildResult& last_build() const { return last_build_; }
    const PaneConfig& config() const { return config_; }
    const std::string& search_query() const { return pending_query_; }
    const std::string& applied_search_query() const { return applied_query_; }
    bool has_pending_updates() const { return search_trigger_.pending() || change_trigger_.pending(); }

    const ExpansionStore& expansion() const { return expansion_; }
    const FocusNavigator& focus() const { return focus_; }

private:
    /// Pane state an operation may change before its rebuild.
    struct Checkpoint {
        ExpansionStore::Snapshot expansion;
        FocusNavigator::Snapshot focus;
        PaneConfig config;
        SearchOptions search_options;
        std::string applied_query;
        std::optional<std::string> selected;
    };

    Checkpoint checkpoint() const;
    /// Rebuilds; on failure the pane returns to @p saved.
    TreeOperationResult commit(Checkpoint saved);
    TreeOperationResult rebuild();
    void apply_search_query();
    void select_index(std::size_t index);
    void apply_change_to_selection(const ChangeNotice& notice);
    std::optional<std::size_t> selected_index() const;

    PaneId id_;
    const HierarchySource& source_;
    PaneConfig config_;
    SearchOptions search_options_;
    SortEngine sorter_;
    SearchEngine search_;
    TreeBuilder builder_;
    ExpansionStore expansion_;
    FocusNavigator focus_;

    std::string pending_query_;
    std::string applied_query_;
    TreeNodePtr tree_;
    BuildResult last_build_;
    std::vector<FlatRow> rows_;
    std::optional<std::string> selected_;
    std::optional<ScrollRequest> scroll_request_;
    double scroll_offset_{0.0};
    double viewport_height_{0.0};
    double row_height_{1.0};
    RowsChangedCallback rows_changed_;

    DebouncedTrigger search_trigger_;
    DebouncedTrigger change_trigger_;
};

#endif
