#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

/// Joins a hierarchy path and a child name; an empty or "/" parent yields the bare name.
std::string join_path(const std::string& parent, const std::string& name);

/// Parent of a hierarchy path, or an empty string for top-level paths.
std::string parent_path(const std::string& path);

/// Last segment of a hierarchy path.
std::string base_name(const std::string& path);

/**
 * @brief Proper ancestors of @p path, outermost first.
 *
 * The chain stops below @p root_path: the root itself and anything above it
 * are never included, and neither is @p path.
 */
std::vector<std::string> ancestor_chain(const std::string& path, const std::string& root_path);

bool is_same_or_descendant(const std::string& path, const std::string& ancestor);

/// Rewrites the @p old_prefix part of @p path to @p new_prefix; the caller checks is_same_or_descendant first.
std::string replace_prefix(const std::string& path,
                           const std::string& old_prefix,
                           const std::string& new_prefix);

std::string trim_copy(const std::string& value);
bool is_blank(const std::string& value);

std::int64_t now_ms();

} // namespace Utils

#endif
