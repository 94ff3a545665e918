#ifndef TREE_BUILDER_HPP
#define TREE_BUILDER_HPP

#include "ExpansionStore.hpp"
#include "FolderCountCache.hpp"
#include "HierarchySource.hpp"
#include "SearchEngine.hpp"
#include "SortEngine.hpp"
#include "TreeNode.hpp"
#include "Types.hpp"

#include <cstddef>
#include <string>

struct BuildOptions {
    bool include_files{false};
    int max_depth{50};
    SortCriterion sort_criterion{SortCriterion::Name};
    const ExpansionStore* expansion{nullptr};
    std::string search_query;
    SearchOptions search_options;
};

struct BuildResult {
    TreeNodePtr root;
    std::size_t node_count{0};
    std::size_t unreadable_count{0};
    std::size_t match_count{0};
    bool pattern_fell_back{false};
    std::string pattern_error;
};

/**
 * @brief Builds the in-memory tree for one pane.
 *
 * Children are only materialized for expanded containers, or for every
 * container while a search is active. The effective root is always treated
 * as expanded and sits at level -1.
 */
class TreeBuilder {
public:
    TreeBuilder(const HierarchySource& source,
                const SortEngine& sorter,
                const SearchEngine& search,
                const FolderCountCache* counts = nullptr);

    BuildResult build(const EntryPtr& root, const BuildOptions& options) const;

    void set_count_cache(const FolderCountCache* counts) { counts_ = counts; }

private:
    struct BuildContext;

    TreeNodePtr build_node(const EntryPtr& item, const std::string& parent_path,
                           int level, BuildContext& context) const;
    void populate_children(TreeNode& node, BuildContext& context) const;

    const HierarchySource& source_;
    const SortEngine& sorter_;
    const SearchEngine& search_;
    const FolderCountCache* counts_;
};

#endif
