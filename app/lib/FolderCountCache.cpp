#include "FolderCountCache.hpp"
#include "Logger.hpp"
#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <vector>

namespace {
std::vector<EntryPtr> list_children(const HierarchySource& source, const std::string& path, bool& readable)
{
    readable = true;
    try {
        return source.children(path);
    } catch (const SourceUnavailableError& ex) {
        readable = false;
        if (auto logger = Logger::get_logger("tree_logger")) {
            logger->warn("Counting skipped unreadable folder '{}': {}", path, ex.what());
        }
        return {};
    }
}
}

FolderCountCache::FolderCountCache(const HierarchySource& source)
    : source_(source),
      root_path_(source.root()->path)
{
}

std::size_t FolderCountCache::compute_counts(std::size_t node_budget)
{
    return compute_counts(*source_.root(), node_budget);
}

std::size_t FolderCountCache::compute_counts(const HierarchyEntry& root, std::size_t node_budget)
{
    if (!root.is_container()) {
        return 0;
    }
    erase_subtree(root.path);
    Budget budget{node_budget, 0};
    scan(root.path, budget);
    if (root.path != root_path_) {
        refresh_chain(parent_key(root.path));
    }

    if (auto logger = Logger::get_logger("tree_logger")) {
        logger->debug("Counted {} entr(ies) under '{}'{}", budget.used, root.path,
                      budget.exhausted() ? " (budget exhausted)" : "");
    }
    return budget.used;
}

FolderCountEntry FolderCountCache::scan(const std::string& path, Budget& budget)
{
    FolderCountEntry entry;
    bool readable = true;
    const auto children = list_children(source_, path, readable);
    entry.is_complete = readable;

    for (const auto& child : children) {
        ++budget.used;
        if (!child->is_container()) {
            ++entry.file_count;
            ++entry.recursive_file_count;
            continue;
        }
        ++entry.folder_count;
        ++entry.recursive_folder_count;
        if (budget.exhausted()) {
            entry.is_complete = false;
            continue;
        }
        const FolderCountEntry child_entry = scan(child->path, budget);
        entry.recursive_file_count += child_entry.recursive_file_count;
        entry.recursive_folder_count += child_entry.recursive_folder_count;
        if (!child_entry.is_complete) {
            entry.is_complete = false;
        }
    }

    entry.total_items = entry.file_count + entry.folder_count;
    entry.last_updated = Utils::now_ms();
    entries_[path] = entry;
    return entry;
}

void FolderCountCache::recount_direct(const std::string& path)
{
    FolderCountEntry entry;
    bool readable = true;
    const auto children = list_children(source_, path, readable);
    entry.is_complete = readable;

    for (const auto& child : children) {
        if (!child->is_container()) {
            ++entry.file_count;
            ++entry.recursive_file_count;
            continue;
        }
        ++entry.folder_count;
        ++entry.recursive_folder_count;
        auto it = entries_.find(child->path);
        if (it == entries_.end()) {
            Budget unlimited;
            scan(child->path, unlimited);
            it = entries_.find(child->path);
        }
        entry.recursive_file_count += it->second.recursive_file_count;
        entry.recursive_folder_count += it->second.recursive_folder_count;
        if (!it->second.is_complete) {
            entry.is_complete = false;
        }
    }

    entry.total_items = entry.file_count + entry.folder_count;
    entry.last_updated = Utils::now_ms();
    entries_[path] = entry;
}

void FolderCountCache::refresh_chain(const std::string& start_path)
{
    std::string path = start_path;
    while (true) {
        if (source_.is_container(path)) {
            recount_direct(path);
        }
        if (path == root_path_ || !Utils::is_same_or_descendant(path, root_path_)) {
            break;
        }
        path = parent_key(path);
    }
}

void FolderCountCache::apply_change(const ChangeNotice& notice)
{
    if (entries_.empty()) {
        return;
    }

    if (notice.type == ChangeType::Delete || notice.type == ChangeType::Rename) {
        const std::string& gone = notice.type == ChangeType::Rename && notice.old_path
            ? *notice.old_path
            : notice.path;
        erase_subtree(gone);
        refresh_chain(parent_key(gone));
    }

    if (notice.type == ChangeType::Create || notice.type == ChangeType::Rename) {
        if (source_.is_container(notice.path)) {
            Budget unlimited;
            scan(notice.path, unlimited);
        }
        refresh_chain(parent_key(notice.path));
    }
}

std::optional<FolderCountEntry> FolderCountCache::get(const std::string& path) const
{
    if (auto it = entries_.find(path); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FolderCountCache::erase_subtree(const std::string& path)
{
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (Utils::is_same_or_descendant(it->first, path)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string FolderCountCache::parent_key(const std::string& path) const
{
    const std::string parent = Utils::parent_path(path);
    return parent.empty() ? root_path_ : parent;
}
