#ifndef EXPANSION_STORE_HPP
#define EXPANSION_STORE_HPP

#include "HierarchySource.hpp"
#include "Types.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Set of expanded container paths for one pane.
 *
 * The hierarchy root named at construction is always treated as expanded
 * and is never stored.
 */
class ExpansionStore {
public:
    using Snapshot = std::unordered_set<std::string>;

    static constexpr int kDefaultExpandAllDepth = 50;

    explicit ExpansionStore(std::string root_path = {});

    bool is_expanded(const std::string& path) const;
    void toggle(const std::string& path);
    void expand(const std::string& path);
    void collapse(const std::string& path);

    /// Expands every container reachable from @p root within @p max_depth levels.
    std::size_t expand_all(const HierarchySource& source, const HierarchyEntry& root,
                           int max_depth = kDefaultExpandAllDepth);
    void collapse_all();

    /// Expands every ancestor of @p target_path; siblings keep their state.
    std::size_t expand_to_path(const std::string& target_path);

    /// Drops deleted paths and rewrites renamed ones.
    void apply_change(const ChangeNotice& notice);

    Snapshot snapshot() const { return expanded_; }
    void restore(Snapshot snapshot) { expanded_ = std::move(snapshot); }

    /// Sorted list form used for persistence.
    std::vector<std::string> to_list() const;
    void from_list(const std::vector<std::string>& paths);

    std::size_t size() const { return expanded_.size(); }
    const std::string& root_path() const { return root_path_; }

private:
    void expand_recursive(const HierarchySource& source, const std::string& path,
                          int level, int max_depth, std::size_t& added);

    std::string root_path_;
    Snapshot expanded_;
};

#endif
