#include "ExpansionStore.hpp"
#include "Logger.hpp"
#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <algorithm>

ExpansionStore::ExpansionStore(std::string root_path)
    : root_path_(std::move(root_path))
{
}

bool ExpansionStore::is_expanded(const std::string& path) const
{
    return path == root_path_ || expanded_.contains(path);
}

void ExpansionStore::toggle(const std::string& path)
{
    if (expanded_.erase(path) == 0) {
        expanded_.insert(path);
    }
}

void ExpansionStore::expand(const std::string& path)
{
    expanded_.insert(path);
}

void ExpansionStore::collapse(const std::string& path)
{
    expanded_.erase(path);
}

std::size_t ExpansionStore::expand_all(const HierarchySource& source, const HierarchyEntry& root,
                                       int max_depth)
{
    std::size_t added = 0;
    if (!root.is_container() || max_depth <= 0) {
        return added;
    }
    if (root.path != root_path_ && expanded_.insert(root.path).second) {
        ++added;
    }
    expand_recursive(source, root.path, 0, max_depth, added);
    return added;
}

void ExpansionStore::expand_recursive(const HierarchySource& source, const std::string& path,
                                      int level, int max_depth, std::size_t& added)
{
    if (level >= max_depth) {
        return;
    }
    std::vector<EntryPtr> children;
    try {
        children = source.children(path);
    } catch (const SourceUnavailableError& ex) {
        if (auto logger = Logger::get_logger("tree_logger")) {
            logger->warn("Skipping unreadable folder '{}' while expanding: {}", path, ex.what());
        }
        return;
    }
    for (const auto& child : children) {
        if (!child->is_container()) {
            continue;
        }
        if (expanded_.insert(child->path).second) {
            ++added;
        }
        expand_recursive(source, child->path, level + 1, max_depth, added);
    }
}

void ExpansionStore::collapse_all()
{
    expanded_.clear();
}

std::size_t ExpansionStore::expand_to_path(const std::string& target_path)
{
    std::size_t added = 0;
    for (const auto& ancestor : Utils::ancestor_chain(target_path, root_path_)) {
        if (expanded_.insert(ancestor).second) {
            ++added;
        }
    }
    return added;
}

void ExpansionStore::apply_change(const ChangeNotice& notice)
{
    const std::string& affected = notice.type == ChangeType::Rename && notice.old_path
        ? *notice.old_path
        : notice.path;
    if (notice.type == ChangeType::Create) {
        return;
    }

    Snapshot updated;
    updated.reserve(expanded_.size());
    for (const auto& path : expanded_) {
        if (!Utils::is_same_or_descendant(path, affected)) {
            updated.insert(path);
        } else if (notice.type == ChangeType::Rename) {
            updated.insert(Utils::replace_prefix(path, affected, notice.path));
        }
    }
    expanded_ = std::move(updated);
}

std::vector<std::string> ExpansionStore::to_list() const
{
    std::vector<std::string> paths(expanded_.begin(), expanded_.end());
    std::sort(paths.begin(), paths.end());
    return paths;
}

void ExpansionStore::from_list(const std::vector<std::string>& paths)
{
    expanded_.clear();
    for (const auto& path : paths) {
        if (!path.empty()) {
            expanded_.insert(path);
        }
    }
}
