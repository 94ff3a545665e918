#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}

std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}

std::string join_path(const std::string& parent, const std::string& name)
{
    if (parent.empty() || parent == "/") {
        return name;
    }
    return parent + "/" + name;
}

std::string parent_path(const std::string& path)
{
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return {};
    }
    return path.substr(0, slash);
}

std::string base_name(const std::string& path)
{
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::vector<std::string> ancestor_chain(const std::string& path, const std::string& root_path)
{
    std::vector<std::string> chain;
    const bool has_root = !root_path.empty() && root_path != "/";
    for (auto slash = path.find('/', 1); slash != std::string::npos; slash = path.find('/', slash + 1)) {
        if (path[slash - 1] == '/') {
            continue;
        }
        std::string current = path.substr(0, slash);
        if (has_root && is_same_or_descendant(root_path, current)) {
            continue;
        }
        chain.push_back(std::move(current));
    }
    return chain;
}

bool is_same_or_descendant(const std::string& path, const std::string& ancestor)
{
    if (ancestor.empty() || ancestor == "/") {
        return true;
    }
    if (path == ancestor) {
        return true;
    }
    return path.size() > ancestor.size() &&
           path.starts_with(ancestor) &&
           path[ancestor.size()] == '/';
}

std::string replace_prefix(const std::string& path,
                           const std::string& old_prefix,
                           const std::string& new_prefix)
{
    if (path == old_prefix) {
        return new_prefix;
    }
    return join_path(new_prefix, path.substr(old_prefix.size() + 1));
}

std::string trim_copy(const std::string& value)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto begin = std::find_if(value.begin(), value.end(), not_space);
    const auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool is_blank(const std::string& value)
{
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char ch) { return std::isspace(ch); });
}

std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace Utils
