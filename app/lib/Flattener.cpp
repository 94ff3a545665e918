#include "Flattener.hpp"

#include <algorithm>
#include <cmath>

namespace {
void visit(TreeNode& node, std::vector<const TreeNode*>& out)
{
    if (node.level >= 0) {
        node.virtual_index = static_cast<int>(out.size());
        out.push_back(&node);
    }
    if (!node.is_expanded) {
        return;
    }
    for (auto& child : node.children) {
        visit(*child, out);
    }
}
}

std::vector<const TreeNode*> Flattener::flatten(TreeNode& root)
{
    std::vector<const TreeNode*> nodes;
    visit(root, nodes);
    return nodes;
}

FlatRow Flattener::to_row(const TreeNode& node)
{
    FlatRow row;
    row.path = node.path;
    row.parent_path = node.parent_path;
    row.label = node.name();
    row.level = node.level;
    row.type = node.type;
    row.is_expanded = node.is_expanded;
    row.has_children = node.has_children;
    row.depth_limited = node.depth_limited;
    row.file_count = node.file_count;
    if (node.matches_search) {
        row.search_score = node.search_score;
    }
    row.virtual_index = node.virtual_index < 0 ? 0 : static_cast<std::size_t>(node.virtual_index);
    return row;
}

std::vector<FlatRow> Flattener::project(TreeNode& root)
{
    const auto nodes = flatten(root);
    std::vector<FlatRow> rows;
    rows.reserve(nodes.size());
    for (const auto* node : nodes) {
        rows.push_back(to_row(*node));
    }
    return rows;
}

VirtualWindow Flattener::compute_window(std::size_t total_rows,
                                        double scroll_offset,
                                        double viewport_height,
                                        double row_height,
                                        std::size_t overscan)
{
    VirtualWindow window;
    if (total_rows == 0 || row_height <= 0.0 || viewport_height <= 0.0) {
        return window;
    }
    const std::size_t last_row = total_rows - 1;
    const double offset = std::max(0.0, scroll_offset);

    const auto first = static_cast<std::size_t>(std::floor(offset / row_height));
    const auto last_edge = static_cast<std::size_t>(std::ceil((offset + viewport_height) / row_height));

    window.first_visible = std::min(first, last_row);
    window.last_visible = std::min(last_edge == 0 ? 0 : last_edge - 1, last_row);
    window.start = window.first_visible > overscan ? window.first_visible - overscan : 0;
    window.end = std::min(window.last_visible + overscan, last_row);
    window.empty = false;
    return window;
}
