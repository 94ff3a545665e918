#include "TreeBuilder.hpp"
#include "Logger.hpp"
#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <vector>

struct TreeBuilder::BuildContext {
    const BuildOptions& options;
    bool searching{false};
    int max_depth{1};
    std::size_t node_count{0};
    std::size_t unreadable_count{0};
    std::shared_ptr<spdlog::logger> logger;
};

TreeBuilder::TreeBuilder(const HierarchySource& source,
                         const SortEngine& sorter,
                         const SearchEngine& search,
                         const FolderCountCache* counts)
    : source_(source),
      sorter_(sorter),
      search_(search),
      counts_(counts)
{
}

BuildResult TreeBuilder::build(const EntryPtr& root, const BuildOptions& options) const
{
    BuildContext context{options};
    context.searching = !Utils::is_blank(options.search_query);
    context.max_depth = std::max(1, options.max_depth);
    context.logger = Logger::get_logger("tree_logger");

    TreeNodePtr tree = build_node(root, Utils::parent_path(root->path), -1, context);

    BuildResult result;
    result.node_count = context.node_count;
    result.unreadable_count = context.unreadable_count;

    if (context.searching) {
        SearchOutcome outcome = search_.filter(std::move(tree), options.search_query, options.search_options);
        tree = std::move(outcome.tree);
        result.match_count = outcome.match_count;
        result.pattern_fell_back = outcome.pattern_fell_back;
        result.pattern_error = std::move(outcome.pattern_error);
    }

    if (context.logger) {
        context.logger->debug("Built tree at '{}': {} node(s), sort={}, files={}, depth={}",
                              root->path, result.node_count, to_string(options.sort_criterion),
                              options.include_files, context.max_depth);
    }
    result.root = std::move(tree);
    return result;
}

TreeNodePtr TreeBuilder::build_node(const EntryPtr& item, const std::string& parent_path,
                                    int level, BuildContext& context) const
{
    auto node = std::make_unique<TreeNode>();
    node->item = item;
    node->path = item->path;
    node->parent_path = parent_path;
    node->level = level;
    node->type = item->type;
    node->last_modified = item->modified_time;
    ++context.node_count;

    if (node->is_folder()) {
        node->is_expanded = level < 0 ||
            (context.options.expansion && context.options.expansion->is_expanded(node->path));
        populate_children(*node, context);
    } else {
        node->size = item->size;
    }
    return node;
}

void TreeBuilder::populate_children(TreeNode& node, BuildContext& context) const
{
    std::vector<EntryPtr> children;
    try {
        children = source_.children(node.path);
    } catch (const SourceUnavailableError& ex) {
        ++context.unreadable_count;
        if (context.logger) {
            context.logger->warn("Treating '{}' as empty: {}", node.path, ex.what());
        }
        return;
    }

    const auto direct_files = static_cast<std::size_t>(std::count_if(
        children.begin(), children.end(),
        [](const EntryPtr& child) { return !child->is_container(); }));
    const auto cached = counts_ ? counts_->get(node.path) : std::nullopt;
    node.file_count = cached ? cached->recursive_file_count : direct_files;

    if (!context.options.include_files) {
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [](const EntryPtr& child) { return !child->is_container(); }),
                       children.end());
    }
    node.has_children = !children.empty();
    if (!node.has_children) {
        return;
    }

    const int child_level = node.level + 1;
    if (child_level >= context.max_depth) {
        node.depth_limited = true;
        return;
    }
    if (!node.is_expanded && !context.searching) {
        return;
    }

    sorter_.sort_entries(children, context.options.sort_criterion);
    node.children.reserve(children.size());
    for (const auto& child : children) {
        node.children.push_back(build_node(child, node.path, child_level, context));
    }
}
