#ifndef FILESYSTEM_HIERARCHY_SOURCE_HPP
#define FILESYSTEM_HIERARCHY_SOURCE_HPP

#include "HierarchySource.hpp"
#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Hierarchy source backed by a directory on disk.
 *
 * Paths are relative to the root directory and use '/' separators; the root
 * itself has the empty path. Junk files are always skipped, hidden entries
 * only appear with FileScanOptions::HiddenFiles. Links to directories are
 * never listed or traversed, and absolute or ".." paths do not resolve.
 */
class FilesystemHierarchySource : public HierarchySource {
public:
    explicit FilesystemHierarchySource(fs::path root_directory,
                                       FileScanOptions options = FileScanOptions::Files |
                                                                 FileScanOptions::Directories);

    EntryPtr root() const override;
    EntryPtr resolve(const std::string& path) const override;
    std::vector<EntryPtr> children(const std::string& path) const override;

    const fs::path& root_directory() const { return root_directory_; }

private:
    struct ScanContext;
    std::optional<HierarchyEntry> build_entry(const fs::directory_entry& entry,
                                              const std::string& parent_path,
                                              const ScanContext& context) const;
    bool should_skip_entry(const fs::path& entry_path,
                           const std::string& file_name,
                           const ScanContext& context) const;
    std::optional<NodeType> classify_entry(const fs::directory_entry& entry,
                                           const ScanContext& context) const;
    bool is_file_hidden(const fs::path& path) const;
    bool is_junk_file(const std::string& name) const;
    /// Disk location of @p path, or nothing when the path would leave the root.
    std::optional<fs::path> to_disk_path(const std::string& path) const;
    bool crosses_directory_link(const fs::path& relative) const;

    fs::path root_directory_;
    FileScanOptions options_;
};

#endif
