#include "TreePane.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace {
std::string root_path_of(const HierarchySource& source)
{
    const EntryPtr root = source.root();
    return root ? root->path : std::string();
}

SearchOptions search_options_from(const PaneConfig& config)
{
    SearchOptions options;
    options.case_sensitive = config.case_sensitive_search;
    options.mode = config.search_mode;
    return options;
}
}

TreePane::TreePane(PaneId id,
                   const HierarchySource& source,
                   const PaneConfig& config,
                   const FolderCountCache* counts)
    : id_(id),
      source_(source),
      config_(config),
      search_options_(search_options_from(config)),
      builder_(source, sorter_, search_, counts),
      expansion_(root_path_of(source)),
      focus_(source, expansion_, static_cast<std::size_t>(std::max(1, config.max_focus_history))),
      search_trigger_([this]() { apply_search_query(); }, config.search_debounce_ms),
      change_trigger_([this]() { rebuild(); }, config.change_debounce_ms)
{
}

TreeOperationResult TreePane::refresh()
{
    return rebuild();
}

TreeOperationResult TreePane::rebuild()
{
    auto logger = Logger::get_logger("tree_logger");
    try {
        EntryPtr root = focus_.effective_root();
        if (!root) {
            throw SourceUnavailableError("Hierarchy source has no root", "");
        }

        BuildOptions options;
        options.include_files = config_.show_files_in_tree;
        options.max_depth = config_.max_render_depth;
        options.sort_criterion = config_.sort_by;
        options.expansion = &expansion_;
        options.search_query = applied_query_;
        options.search_options = search_options_;

        BuildResult result = builder_.build(root, options);
        std::vector<FlatRow> rows = Flattener::project(*result.root);

        tree_ = std::move(result.root);
        last_build_ = std::move(result);
        rows_ = std::move(rows);
    } catch (const std::exception& ex) {
        if (logger) {
            logger->error("Pane '{}' rebuild failed, keeping {} previous rows: {}",
                          to_string(id_), rows_.size(), ex.what());
        }
        return TreeOperationResult::failure(TreeErrorCode::SourceUnavailable, ex.what());
    }

    if (logger) {
        logger->debug("Pane '{}' rebuilt: {} rows, {} nodes, {} unreadable",
                      to_string(id_), rows_.size(), last_build_.node_count, last_build_.unreadable_count);
    }
    if (rows_changed_) {
        rows_changed_(rows_);
    }
    return TreeOperationResult::ok(rows_.size());
}

TreePane::Checkpoint TreePane::checkpoint() const
{
    return Checkpoint{expansion_.snapshot(), focus_.snapshot(), config_,
                      search_options_, applied_query_, selected_};
}

TreeOperationResult TreePane::commit(Checkpoint saved)
{
    TreeOperationResult result = rebuild();
    if (!result) {
        expansion_.restore(std::move(saved.expansion));
        focus_.restore(std::move(saved.focus));
        config_ = std::move(saved.config);
        search_options_ = std::move(saved.search_options);
        applied_query_ = std::move(saved.applied_query);
        selected_ = std::move(saved.selected);
    }
    return result;
}

TreeOperationResult TreePane::toggle_expand(const std::string& path)
{
    if (!source_.is_container(path)) {
        return TreeOperationResult::failure(TreeErrorCode::InvalidFocusTarget,
                                            "Not a folder: " + path);
    }
    Checkpoint saved = checkpoint();
    expansion_.toggle(path);
    return commit(std::move(saved));
}

TreeOperationResult TreePane::expand_all()
{
    EntryPtr root = focus_.effective_root();
    if (!root) {
        return TreeOperationResult::failure(TreeErrorCode::SourceUnavailable, "Hierarchy source has no root");
    }
    Checkpoint saved = checkpoint();
    std::size_t added = 0;
    try {
        added = expansion_.expand_all(source_, *root, config_.expand_all_depth);
    } catch (const std::exception& ex) {
        expansion_.restore(std::move(saved.expansion));
        if (auto logger = Logger::get_logger("tree_logger")) {
            logger->error("Pane '{}' expand all failed: {}", to_string(id_), ex.what());
        }
        return TreeOperationResult::failure(TreeErrorCode::SourceUnavailable, ex.what());
    }
    TreeOperationResult result = commit(std::move(saved));
    if (result) {
        result.affected_items = added;
    }
    return result;
}

TreeOperationResult TreePane::collapse_all()
{
    const std::size_t removed = expansion_.size();
    Checkpoint saved = checkpoint();
    expansion_.collapse_all();
    TreeOperationResult result = commit(std::move(saved));
    if (result) {
        result.affected_items = removed;
    }
    return result;
}

TreeOperationResult TreePane::reveal_path(const std::string& path)
{
    if (!source_.resolve(path)) {
        return TreeOperationResult::failure(TreeErrorCode::InvalidFocusTarget, "Path not found: " + path);
    }

    Checkpoint saved = checkpoint();
    const auto& focused = focus_.focused_path();
    if (focused && (path == *focused || !Utils::is_same_or_descendant(path, *focused))) {
        focus_.unfocus();
    }

    const std::size_t expanded = expansion_.expand_to_path(path);
    TreeOperationResult result = commit(std::move(saved));
    if (!result) {
        return result;
    }
    if (auto index = KeyboardNavigator::index_of(rows_, path)) {
        select_index(*index);
    }
    result.affected_items = expanded;
    return result;
}

void TreePane::set_sort_criterion(SortCriterion criterion)
{
    if (config_.sort_by == criterion) {
        return;
    }
    Checkpoint saved = checkpoint();
    config_.sort_by = criterion;
    commit(std::move(saved));
}

void TreePane::set_include_files(bool include_files)
{
    if (config_.show_files_in_tree == include_files) {
        return;
    }
    Checkpoint saved = checkpoint();
    config_.show_files_in_tree = include_files;
    commit(std::move(saved));
}

void TreePane::set_max_render_depth(int depth)
{
    const int clamped = std::max(1, depth);
    if (config_.max_render_depth == clamped) {
        return;
    }
    Checkpoint saved = checkpoint();
    config_.max_render_depth = clamped;
    commit(std::move(saved));
}

void TreePane::set_search_options(const SearchOptions& options)
{
    Checkpoint saved = checkpoint();
    search_options_ = options;
    config_.case_sensitive_search = options.case_sensitive;
    config_.search_mode = options.mode;
    if (!Utils::is_blank(applied_query_)) {
        commit(std::move(saved));
    }
}

void TreePane::set_config(const PaneConfig& config)
{
    Checkpoint saved = checkpoint();
    config_ = config;
    search_options_.case_sensitive = config.case_sensitive_search;
    search_options_.mode = config.search_mode;
    if (!commit(std::move(saved))) {
        return;
    }
    search_trigger_.set_interval(config.search_debounce_ms);
    change_trigger_.set_interval(config.change_debounce_ms);
    focus_.set_history_limit(static_cast<std::size_t>(std::max(1, config.max_focus_history)));
}

void TreePane::set_search_query(const std::string& query)
{
    pending_query_ = query;
    search_trigger_.schedule();
}

void TreePane::apply_search_query()
{
    if (pending_query_ == applied_query_) {
        return;
    }
    Checkpoint saved = checkpoint();
    applied_query_ = pending_query_;
    commit(std::move(saved));
}

TreeOperationResult TreePane::focus_on(const std::string& path)
{
    Checkpoint saved = checkpoint();
    TreeOperationResult result = focus_.focus_on(path);
    if (!result) {
        return result;
    }
    return commit(std::move(saved));
}

void TreePane::unfocus()
{
    if (!focus_.is_focused()) {
        return;
    }
    Checkpoint saved = checkpoint();
    focus_.unfocus();
    commit(std::move(saved));
}

bool TreePane::go_back()
{
    Checkpoint saved = checkpoint();
    if (!focus_.go_back()) {
        return false;
    }
    return static_cast<bool>(commit(std::move(saved)));
}

bool TreePane::go_forward()
{
    Checkpoint saved = checkpoint();
    if (!focus_.go_forward()) {
        return false;
    }
    return static_cast<bool>(commit(std::move(saved)));
}

std::optional<std::size_t> TreePane::navigate(const NavigationMove& move)
{
    auto index = KeyboardNavigator::resolve(rows_, selected_, move);
    if (index) {
        select_index(*index);
    }
    return index;
}

bool TreePane::select(const std::string& path)
{
    auto index = KeyboardNavigator::index_of(rows_, path);
    if (!index) {
        return false;
    }
    select_index(*index);
    return true;
}

void TreePane::select_index(std::size_t index)
{
    selected_ = rows_[index].path;
    scroll_request_ = KeyboardNavigator::scroll_into_view(index, window());
}

std::optional<std::size_t> TreePane::selected_index() const
{
    if (!selected_) {
        return std::nullopt;
    }
    return KeyboardNavigator::index_of(rows_, *selected_);
}

bool TreePane::expand_selected()
{
    auto index = selected_index();
    if (!index) {
        return false;
    }
    const FlatRow& row = rows_[*index];
    if (row.type != NodeType::Folder || row.is_expanded || !row.has_children) {
        return false;
    }
    Checkpoint saved = checkpoint();
    expansion_.expand(row.path);
    return static_cast<bool>(commit(std::move(saved)));
}

bool TreePane::collapse_selected()
{
    auto index = selected_index();
    if (!index) {
        return false;
    }
    const FlatRow& row = rows_[*index];
    if (row.type != NodeType::Folder || !row.is_expanded) {
        return false;
    }
    Checkpoint saved = checkpoint();
    expansion_.collapse(row.path);
    return static_cast<bool>(commit(std::move(saved)));
}

void TreePane::apply_change_to_selection(const ChangeNotice& notice)
{
    if (!selected_) {
        return;
    }
    if (notice.type == ChangeType::Delete && Utils::is_same_or_descendant(*selected_, notice.path)) {
        selected_.reset();
        scroll_request_.reset();
    } else if (notice.type == ChangeType::Rename && notice.old_path &&
               Utils::is_same_or_descendant(*selected_, *notice.old_path)) {
        selected_ = Utils::replace_prefix(*selected_, *notice.old_path, notice.path);
    }
}

void TreePane::notify_change(const ChangeNotice& notice)
{
    expansion_.apply_change(notice);
    focus_.apply_change(notice);
    apply_change_to_selection(notice);
    change_trigger_.schedule();
}

void TreePane::flush_pending()
{
    const bool changes_pending = change_trigger_.pending();
    change_trigger_.cancel();
    const std::string query_before = applied_query_;
    search_trigger_.flush();
    if (changes_pending && applied_query_ == query_before) {
        rebuild();
    }
}

void TreePane::set_viewport(double viewport_height, double row_height)
{
    viewport_height_ = std::max(0.0, viewport_height);
    row_height_ = row_height;
}

void TreePane::set_scroll_offset(double scroll_offset)
{
    scroll_offset_ = std::max(0.0, scroll_offset);
}

VirtualWindow TreePane::window() const
{
    return Flattener::compute_window(rows_.size(), scroll_offset_, viewport_height_, row_height_);
}

std::vector<SearchHit> TreePane::search_hits(std::size_t max_results) const
{
    if (!tree_ || Utils::is_blank(applied_query_)) {
        return {};
    }
    return search_.rank(*tree_, applied_query_, search_options_, max_results);
}

PaneState TreePane::capture_state() const
{
    PaneState state;
    state.expanded_folders = expansion_.to_list();
    state.focused_folder = focus_.focused_path();
    state.selected_folder = selected_;
    state.sort_by = config_.sort_by;
    state.show_files_in_tree = config_.show_files_in_tree;
    state.max_render_depth = config_.max_render_depth;
    state.focus_history = focus_.history();
    state.search_query = applied_query_;
    state.last_updated = Utils::now_ms();
    return state;
}

TreeOperationResult TreePane::restore_state(const PaneState& state)
{
    Checkpoint saved = checkpoint();
    expansion_.from_list(state.expanded_folders);
    focus_.restore(state.focused_folder, state.focus_history);
    config_.sort_by = state.sort_by;
    config_.show_files_in_tree = state.show_files_in_tree;
    config_.max_render_depth = std::max(1, state.max_render_depth);
    applied_query_ = state.search_query;
    pending_query_ = state.search_query;

    TreeOperationResult result = commit(std::move(saved));
    if (!result) {
        pending_query_ = applied_query_;
        return result;
    }
    selected_.reset();
    if (state.selected_folder) {
        select(*state.selected_folder);
    }
    return result;
}
