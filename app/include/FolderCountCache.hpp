#ifndef FOLDER_COUNT_CACHE_HPP
#define FOLDER_COUNT_CACHE_HPP

#include "HierarchySource.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

struct FolderCountEntry {
    std::size_t file_count{0};
    std::size_t folder_count{0};
    std::size_t total_items{0};
    std::size_t recursive_file_count{0};
    std::size_t recursive_folder_count{0};
    std::int64_t last_updated{0};
    bool is_complete{false}; ///< False when the scan stopped early or a subfolder was unreadable.
};

/**
 * @brief Recursive item counts per folder path.
 *
 * Built by one bottom-up pass; change notices only recompute the touched
 * subtree and its ancestor chain.
 */
class FolderCountCache {
public:
    explicit FolderCountCache(const HierarchySource& source);

    /**
     * @brief Recounts the subtree under @p root.
     * @param node_budget Maximum number of entries to visit, 0 for no limit.
     * @return Number of entries visited.
     */
    std::size_t compute_counts(const HierarchyEntry& root, std::size_t node_budget = 0);
    std::size_t compute_counts(std::size_t node_budget = 0);

    void apply_change(const ChangeNotice& notice);

    std::optional<FolderCountEntry> get(const std::string& path) const;
    const std::unordered_map<std::string, FolderCountEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    struct Budget {
        std::size_t limit{0};
        std::size_t used{0};
        bool exhausted() const { return limit != 0 && used >= limit; }
    };

    FolderCountEntry scan(const std::string& path, Budget& budget);
    void recount_direct(const std::string& path);
    void refresh_chain(const std::string& start_path);
    void erase_subtree(const std::string& path);
    std::string parent_key(const std::string& path) const;

    const HierarchySource& source_;
    std::string root_path_;
    std::unordered_map<std::string, FolderCountEntry> entries_;
};

#endif
