#ifndef IN_MEMORY_HIERARCHY_SOURCE_HPP
#define IN_MEMORY_HIERARCHY_SOURCE_HPP

#include "HierarchySource.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @brief Mutable hierarchy held entirely in memory.
 *
 * Mutations emit change notices through the source's change channel. Child
 * order is insertion order; the engine sorts on its own.
 */
class InMemoryHierarchySource : public HierarchySource {
public:
    explicit InMemoryHierarchySource(std::string root_path = {});

    EntryPtr root() const override;
    EntryPtr resolve(const std::string& path) const override;
    std::vector<EntryPtr> children(const std::string& path) const override;

    /// Creates the folder and any missing parent folders.
    bool add_folder(const std::string& path, std::int64_t modified_time = 0);
    /// Creates the file; missing parent folders are created first.
    bool add_file(const std::string& path, std::uintmax_t size = 0, std::int64_t modified_time = 0);
    bool remove(const std::string& path);
    bool rename(const std::string& old_path, const std::string& new_path);

    /// Makes children() of @p path throw SourceUnavailableError.
    void set_unreadable(const std::string& path, bool unreadable = true);

    std::size_t entry_count() const { return nodes_.size(); }

private:
    struct Node {
        EntryPtr entry;
        std::vector<std::string> child_paths;
    };

    bool add_entry(const std::string& path, NodeType type,
                   std::uintmax_t size, std::int64_t modified_time);
    bool ensure_parent(const std::string& path);
    std::string parent_key(const std::string& path) const;
    void collect_subtree(const std::string& path, std::vector<std::string>& out) const;
    void detach_from_parent(const std::string& path);

    std::string root_path_;
    std::unordered_map<std::string, Node> nodes_;
    std::unordered_set<std::string> unreadable_;
};

#endif
