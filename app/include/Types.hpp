#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class NodeType {Folder, File};

inline std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Folder: return "folder";
        case NodeType::File: return "file";
        default: return "unknown";
    }
}

enum class SortCriterion {
    Name,
    Modified,
    Size
};

inline std::string to_string(SortCriterion criterion) {
    switch (criterion) {
        case SortCriterion::Name: return "name";
        case SortCriterion::Modified: return "modified";
        case SortCriterion::Size: return "size";
        default: return "name";
    }
}

/// Unknown values fall back to SortCriterion::Name.
inline SortCriterion sort_criterion_from_string(const std::string& value) {
    if (value == "modified") return SortCriterion::Modified;
    if (value == "size") return SortCriterion::Size;
    return SortCriterion::Name;
}

enum class SearchMode {Plain, Regex, Glob};
enum class SearchScope {Names, Paths, All};

inline std::string to_string(SearchMode mode) {
    switch (mode) {
        case SearchMode::Regex: return "regex";
        case SearchMode::Glob: return "glob";
        case SearchMode::Plain:
        default: return "plain";
    }
}

inline SearchMode search_mode_from_string(const std::string& value) {
    if (value == "regex") return SearchMode::Regex;
    if (value == "glob") return SearchMode::Glob;
    return SearchMode::Plain;
}

enum class PaneId {Left, Right};

inline std::string to_string(PaneId pane) {
    return pane == PaneId::Left ? "left" : "right";
}

inline PaneId pane_id_from_string(const std::string& value) {
    return value == "right" ? PaneId::Right : PaneId::Left;
}

/**
 * @brief One entry exposed by a hierarchy source.
 *
 * Only metadata lives here; file content is never loaded by the engine.
 */
struct HierarchyEntry {
    std::string path;
    std::string name;
    NodeType type{NodeType::File};
    std::uintmax_t size{0};
    std::int64_t modified_time{0}; ///< Milliseconds since epoch, 0 when unknown.

    bool is_container() const { return type == NodeType::Folder; }
};

enum class ChangeType {Create, Delete, Rename};

inline std::string to_string(ChangeType type) {
    switch (type) {
        case ChangeType::Create: return "create";
        case ChangeType::Delete: return "delete";
        case ChangeType::Rename: return "rename";
        default: return "unknown";
    }
}

struct ChangeNotice {
    ChangeType type{ChangeType::Create};
    std::string path;
    std::optional<std::string> old_path; ///< Set for renames only.
};

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    Directories = 1 << 1,   // 0010
    HiddenFiles = 1 << 2    // 0100
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

inline FileScanOptions operator&(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) & static_cast<int>(b));
}

#endif
