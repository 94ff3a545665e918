#ifndef FLATTENER_HPP
#define FLATTENER_HPP

#include "TreeNode.hpp"
#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/// One renderable row of the flattened tree.
struct FlatRow {
    std::string path;
    std::string parent_path;
    std::string label;
    int level{0};
    NodeType type{NodeType::File};
    bool is_expanded{false};
    bool has_children{false};
    bool depth_limited{false};
    std::size_t file_count{0};
    std::optional<double> search_score; ///< Only set for direct search matches.
    std::size_t virtual_index{0};
};

/**
 * @brief Rows a renderer should materialize for the current scroll position.
 *
 * [first_visible, last_visible] is what the viewport shows; [start, end]
 * adds the overscan on both sides.
 */
struct VirtualWindow {
    std::size_t start{0};
    std::size_t end{0};
    std::size_t first_visible{0};
    std::size_t last_visible{0};
    bool empty{true};

    bool is_visible(std::size_t index) const {
        return !empty && index >= first_visible && index <= last_visible;
    }
};

class Flattener {
public:
    static constexpr std::size_t kDefaultOverscan = 5;

    /**
     * @brief Pre-order walk of the expanded part of the tree.
     *
     * The effective root is not emitted; its children are. Assigns
     * virtual_index 0..N-1 on the visited nodes.
     */
    static std::vector<const TreeNode*> flatten(TreeNode& root);

    /// Same walk as flatten(), converted to rows.
    static std::vector<FlatRow> project(TreeNode& root);

    static FlatRow to_row(const TreeNode& node);

    static VirtualWindow compute_window(std::size_t total_rows,
                                        double scroll_offset,
                                        double viewport_height,
                                        double row_height,
                                        std::size_t overscan = kDefaultOverscan);
};

#endif
