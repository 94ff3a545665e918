#ifndef TREE_NODE_HPP
#define TREE_NODE_HPP

#include "HierarchySource.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief One entry of a built tree.
 *
 * Nodes are created fresh on every build and own their children. Only the
 * path is a durable identity; the parent link is kept as a path so nothing
 * points back up into the ownership chain.
 */
struct TreeNode {
    EntryPtr item;
    std::string path;
    std::string parent_path;
    int level{0};                  ///< -1 for the effective root, 0 for its children.
    NodeType type{NodeType::File};
    bool has_children{false};
    bool is_expanded{false};
    bool depth_limited{false};     ///< Eligible children exist but were cut by the depth bound.
    std::vector<std::unique_ptr<TreeNode>> children;

    std::size_t file_count{0};
    std::int64_t last_modified{0};
    std::uintmax_t size{0};

    int virtual_index{-1};
    bool matches_search{false};
    double search_score{0.0};

    bool is_folder() const { return type == NodeType::Folder; }
    const std::string& name() const { return item->name; }
};

using TreeNodePtr = std::unique_ptr<TreeNode>;

#endif
