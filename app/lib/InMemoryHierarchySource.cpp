#include "InMemoryHierarchySource.hpp"

#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <algorithm>

namespace {
EntryPtr make_entry(const std::string& path, const std::string& name, NodeType type,
                    std::uintmax_t size, std::int64_t modified_time)
{
    auto entry = std::make_shared<HierarchyEntry>();
    entry->path = path;
    entry->name = name;
    entry->type = type;
    entry->size = size;
    entry->modified_time = modified_time;
    return entry;
}
}

InMemoryHierarchySource::InMemoryHierarchySource(std::string root_path)
    : root_path_(std::move(root_path))
{
    const std::string name = root_path_.empty() || root_path_ == "/"
        ? std::string("/")
        : Utils::base_name(root_path_);
    nodes_[root_path_] = Node{make_entry(root_path_, name, NodeType::Folder, 0, 0), {}};
}

EntryPtr InMemoryHierarchySource::root() const
{
    return nodes_.at(root_path_).entry;
}

EntryPtr InMemoryHierarchySource::resolve(const std::string& path) const
{
    if (auto it = nodes_.find(path); it != nodes_.end()) {
        return it->second.entry;
    }
    return nullptr;
}

std::vector<EntryPtr> InMemoryHierarchySource::children(const std::string& path) const
{
    if (unreadable_.contains(path)) {
        throw SourceUnavailableError("Container is not readable: " + path, path);
    }
    const auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        throw SourceUnavailableError("Container does not exist: " + path, path);
    }
    std::vector<EntryPtr> result;
    result.reserve(it->second.child_paths.size());
    for (const auto& child_path : it->second.child_paths) {
        result.push_back(nodes_.at(child_path).entry);
    }
    return result;
}

std::string InMemoryHierarchySource::parent_key(const std::string& path) const
{
    const std::string parent = Utils::parent_path(path);
    return parent.empty() ? root_path_ : parent;
}

bool InMemoryHierarchySource::add_folder(const std::string& path, std::int64_t modified_time)
{
    return add_entry(path, NodeType::Folder, 0, modified_time);
}

bool InMemoryHierarchySource::add_file(const std::string& path,
                                       std::uintmax_t size,
                                       std::int64_t modified_time)
{
    return add_entry(path, NodeType::File, size, modified_time);
}

bool InMemoryHierarchySource::add_entry(const std::string& path, NodeType type,
                                        std::uintmax_t size, std::int64_t modified_time)
{
    if (path.empty() || nodes_.contains(path) ||
        !Utils::is_same_or_descendant(path, root_path_)) {
        return false;
    }
    if (!ensure_parent(path)) {
        return false;
    }
    const std::string parent = parent_key(path);
    nodes_[path] = Node{make_entry(path, Utils::base_name(path), type, size, modified_time), {}};
    nodes_[parent].child_paths.push_back(path);
    notify_change(ChangeNotice{ChangeType::Create, path, std::nullopt});
    return true;
}

bool InMemoryHierarchySource::ensure_parent(const std::string& path)
{
    const std::string parent = parent_key(path);
    if (parent == root_path_) {
        return true;
    }
    if (auto it = nodes_.find(parent); it != nodes_.end()) {
        return it->second.entry->is_container();
    }
    return add_entry(parent, NodeType::Folder, 0, 0);
}

void InMemoryHierarchySource::collect_subtree(const std::string& path,
                                              std::vector<std::string>& out) const
{
    out.push_back(path);
    const auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        return;
    }
    for (const auto& child : it->second.child_paths) {
        collect_subtree(child, out);
    }
}

void InMemoryHierarchySource::detach_from_parent(const std::string& path)
{
    auto& siblings = nodes_[parent_key(path)].child_paths;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), path), siblings.end());
}

bool InMemoryHierarchySource::remove(const std::string& path)
{
    if (path == root_path_ || !nodes_.contains(path)) {
        return false;
    }
    std::vector<std::string> subtree;
    collect_subtree(path, subtree);
    detach_from_parent(path);
    for (const auto& victim : subtree) {
        nodes_.erase(victim);
        unreadable_.erase(victim);
    }
    notify_change(ChangeNotice{ChangeType::Delete, path, std::nullopt});
    return true;
}

bool InMemoryHierarchySource::rename(const std::string& old_path, const std::string& new_path)
{
    if (old_path == root_path_ || !nodes_.contains(old_path) || nodes_.contains(new_path) ||
        Utils::is_same_or_descendant(new_path, old_path)) {
        return false;
    }
    const std::string new_parent = parent_key(new_path);
    const auto parent_it = nodes_.find(new_parent);
    if (parent_it == nodes_.end() || !parent_it->second.entry->is_container()) {
        return false;
    }

    std::vector<std::string> subtree;
    collect_subtree(old_path, subtree);
    detach_from_parent(old_path);

    std::unordered_map<std::string, Node> moved;
    for (const auto& path : subtree) {
        Node node = std::move(nodes_.at(path));
        nodes_.erase(path);
        const std::string rewritten = Utils::replace_prefix(path, old_path, new_path);
        const auto& old_entry = *node.entry;
        node.entry = make_entry(rewritten, Utils::base_name(rewritten), old_entry.type,
                                old_entry.size, old_entry.modified_time);
        for (auto& child : node.child_paths) {
            child = Utils::replace_prefix(child, old_path, new_path);
        }
        if (unreadable_.erase(path) > 0) {
            unreadable_.insert(rewritten);
        }
        moved.emplace(rewritten, std::move(node));
    }
    for (auto& [path, node] : moved) {
        nodes_.emplace(path, std::move(node));
    }
    nodes_[new_parent].child_paths.push_back(new_path);
    notify_change(ChangeNotice{ChangeType::Rename, new_path, old_path});
    return true;
}

void InMemoryHierarchySource::set_unreadable(const std::string& path, bool unreadable)
{
    if (unreadable) {
        unreadable_.insert(path);
    } else {
        unreadable_.erase(path);
    }
}
