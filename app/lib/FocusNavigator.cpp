#include "FocusNavigator.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

FocusNavigator::FocusNavigator(const HierarchySource& source,
                               ExpansionStore& expansion,
                               std::size_t history_limit)
    : source_(source),
      expansion_(expansion),
      history_limit_(history_limit == 0 ? kDefaultHistoryLimit : history_limit)
{
}

bool FocusNavigator::resolves_to_container(const std::string& path) const
{
    const auto entry = source_.resolve(path);
    return entry && entry->is_container();
}

TreeOperationResult FocusNavigator::focus_on(const std::string& path)
{
    if (!resolves_to_container(path)) {
        if (auto logger = Logger::get_logger("tree_logger")) {
            logger->info("Refusing to focus '{}': not a folder", path);
        }
        return TreeOperationResult::failure(TreeErrorCode::InvalidFocusTarget,
                                            "Target is not a folder: " + path);
    }
    if (focused_path_ && *focused_path_ == path) {
        return TreeOperationResult::ok();
    }

    // The hierarchy root is the unfocused view.
    if (source_.resolve(path)->path == source_.root()->path) {
        if (!focused_path_) {
            return TreeOperationResult::ok();
        }
        push_bounded(back_, capture());
        forward_.clear();
        unfocus();
        return TreeOperationResult::ok(1);
    }

    push_bounded(back_, capture());
    forward_.clear();
    focused_path_ = path;
    rebuild_breadcrumb();

    if (auto logger = Logger::get_logger("tree_logger")) {
        logger->debug("Focused '{}' ({} history entr(ies))", path, back_.size());
    }
    return TreeOperationResult::ok(1);
}

void FocusNavigator::unfocus()
{
    focused_path_.reset();
    breadcrumb_.clear();
}

bool FocusNavigator::go_back()
{
    if (back_.empty()) {
        return false;
    }
    push_bounded(forward_, capture());
    FocusHistoryEntry entry = std::move(back_.back());
    back_.pop_back();
    apply(entry);
    return true;
}

bool FocusNavigator::go_forward()
{
    if (forward_.empty()) {
        return false;
    }
    push_bounded(back_, capture());
    FocusHistoryEntry entry = std::move(forward_.back());
    forward_.pop_back();
    apply(entry);
    return true;
}

EntryPtr FocusNavigator::effective_root()
{
    if (focused_path_) {
        auto entry = source_.resolve(*focused_path_);
        if (entry && entry->is_container()) {
            return entry;
        }
        if (auto logger = Logger::get_logger("tree_logger")) {
            logger->warn("Focused folder '{}' no longer exists; showing the full tree", *focused_path_);
        }
        unfocus();
    }
    return source_.root();
}

void FocusNavigator::apply_change(const ChangeNotice& notice)
{
    if (notice.type == ChangeType::Create) {
        return;
    }
    const std::string& affected = notice.type == ChangeType::Rename && notice.old_path
        ? *notice.old_path
        : notice.path;

    auto rewrite = [&](std::optional<std::string>& path) {
        if (path && Utils::is_same_or_descendant(*path, affected)) {
            path = Utils::replace_prefix(*path, affected, notice.path);
        }
    };

    if (notice.type == ChangeType::Rename) {
        rewrite(focused_path_);
        for (auto& entry : back_) {
            rewrite(entry.path);
        }
        for (auto& entry : forward_) {
            rewrite(entry.path);
        }
        if (focused_path_) {
            rebuild_breadcrumb();
        }
        return;
    }

    if (focused_path_ && Utils::is_same_or_descendant(*focused_path_, affected)) {
        unfocus();
    }
}

void FocusNavigator::restore(const std::optional<std::string>& focused_path,
                             std::deque<FocusHistoryEntry> history)
{
    back_ = std::move(history);
    while (back_.size() > history_limit_) {
        back_.pop_front();
    }
    forward_.clear();
    focused_path_.reset();
    breadcrumb_.clear();
    if (focused_path && resolves_to_container(*focused_path) &&
        source_.resolve(*focused_path)->path != source_.root()->path) {
        focused_path_ = focused_path;
        rebuild_breadcrumb();
    }
}

void FocusNavigator::restore(Snapshot snapshot)
{
    focused_path_ = std::move(snapshot.focused_path);
    breadcrumb_ = std::move(snapshot.breadcrumb);
    back_ = std::move(snapshot.back);
    forward_ = std::move(snapshot.forward);
}

void FocusNavigator::set_history_limit(std::size_t limit)
{
    history_limit_ = limit == 0 ? kDefaultHistoryLimit : limit;
    while (back_.size() > history_limit_) {
        back_.pop_front();
    }
    while (forward_.size() > history_limit_) {
        forward_.pop_front();
    }
}

FocusHistoryEntry FocusNavigator::capture() const
{
    return FocusHistoryEntry{focused_path_, expansion_.snapshot(), Utils::now_ms()};
}

void FocusNavigator::apply(const FocusHistoryEntry& entry)
{
    expansion_.restore(entry.expanded);
    if (entry.path && resolves_to_container(*entry.path)) {
        focused_path_ = entry.path;
        rebuild_breadcrumb();
    } else {
        unfocus();
    }
}

void FocusNavigator::push_bounded(std::deque<FocusHistoryEntry>& stack, FocusHistoryEntry entry)
{
    stack.push_back(std::move(entry));
    while (stack.size() > history_limit_) {
        stack.pop_front();
    }
}

void FocusNavigator::rebuild_breadcrumb()
{
    breadcrumb_.clear();
    if (!focused_path_) {
        return;
    }
    const std::string root_path = source_.root()->path;
    auto segments = Utils::ancestor_chain(*focused_path_, root_path);
    if (*focused_path_ != root_path) {
        segments.push_back(*focused_path_);
    }
    for (const auto& segment : segments) {
        const auto entry = source_.resolve(segment);
        if (!entry || !entry->is_container()) {
            break;
        }
        breadcrumb_.push_back(BreadcrumbItem{entry->name, entry->path});
    }
}
