#include "FilesystemHierarchySource.hpp"
#include "Logger.hpp"
#include "TreeErrors.hpp"
#include "Utils.hpp"

#include <chrono>
#include <system_error>
#include <unordered_set>

#ifdef _WIN32
#include <windows.h>
#endif

struct FilesystemHierarchySource::ScanContext {
    bool include_files{false};
    bool include_directories{false};
    bool include_hidden{false};
    std::shared_ptr<spdlog::logger> logger;
};

namespace {
std::int64_t to_epoch_ms(fs::file_time_type time)
{
    using namespace std::chrono;
    const auto sys_time = file_clock::to_sys(time);
    return duration_cast<milliseconds>(sys_time.time_since_epoch()).count();
}
}

FilesystemHierarchySource::FilesystemHierarchySource(fs::path root_directory,
                                                     FileScanOptions options)
    : root_directory_(std::move(root_directory)),
      options_(options)
{
}

std::optional<fs::path> FilesystemHierarchySource::to_disk_path(const std::string& path) const
{
    if (path.empty() || path == "/") {
        return root_directory_;
    }
    const fs::path relative = Utils::utf8_to_path(path);
    if (relative.has_root_name() || relative.has_root_directory()) {
        return std::nullopt;
    }
    for (const auto& segment : relative) {
        if (segment == "." || segment == "..") {
            return std::nullopt;
        }
    }
    return root_directory_ / relative;
}

bool FilesystemHierarchySource::crosses_directory_link(const fs::path& relative) const
{
    fs::path current = root_directory_;
    for (const auto& segment : relative) {
        current /= segment;
        std::error_code ec;
        if (fs::is_symlink(current, ec)) {
            return true;
        }
    }
    return false;
}

EntryPtr FilesystemHierarchySource::root() const
{
    auto entry = std::make_shared<HierarchyEntry>();
    entry->path = "";
    entry->name = Utils::path_to_utf8(root_directory_.filename());
    entry->type = NodeType::Folder;
    return entry;
}

EntryPtr FilesystemHierarchySource::resolve(const std::string& path) const
{
    if (path.empty() || path == "/") {
        return root();
    }
    const auto disk_path = to_disk_path(path);
    if (!disk_path || crosses_directory_link(Utils::utf8_to_path(Utils::parent_path(path)))) {
        return nullptr;
    }
    std::error_code ec;
    const fs::directory_entry entry(*disk_path, ec);
    if (ec || !entry.exists(ec)) {
        return nullptr;
    }
    ScanContext context;
    context.include_files = true;
    context.include_directories = true;
    context.include_hidden = true;
    if (auto built = build_entry(entry, Utils::parent_path(path), context)) {
        return std::make_shared<HierarchyEntry>(std::move(*built));
    }
    return nullptr;
}

std::vector<EntryPtr> FilesystemHierarchySource::children(const std::string& path) const
{
    std::vector<EntryPtr> result;
    auto logger = Logger::get_logger("core_logger");

    ScanContext context;
    context.include_files = has_flag(options_, FileScanOptions::Files);
    context.include_directories = has_flag(options_, FileScanOptions::Directories);
    context.include_hidden = has_flag(options_, FileScanOptions::HiddenFiles);
    context.logger = logger;

    const auto scan_path = to_disk_path(path);
    if (!scan_path || (*scan_path != root_directory_ && crosses_directory_link(Utils::utf8_to_path(path)))) {
        if (logger) {
            logger->warn("Refusing to list '{}': outside of '{}'",
                         path, Utils::path_to_utf8(root_directory_));
        }
        throw SourceUnavailableError("Path is outside the hierarchy: " + path, path);
    }
    std::error_code ec;
    fs::directory_iterator it(*scan_path, ec);
    if (ec) {
        if (logger) {
            logger->warn("Error while listing '{}': {}", path, ec.message());
        }
        throw SourceUnavailableError("Cannot list '" + path + "': " + ec.message(), path);
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            if (logger) {
                logger->warn("Listing of '{}' interrupted: {}", path, ec.message());
            }
            throw SourceUnavailableError("Cannot list '" + path + "': " + ec.message(), path);
        }
        if (auto entry = build_entry(*it, path, context)) {
            result.push_back(std::make_shared<HierarchyEntry>(std::move(*entry)));
        }
    }

    if (logger) {
        logger->trace("Listed '{}': {} entr(ies)", path, result.size());
    }
    return result;
}

bool FilesystemHierarchySource::is_file_hidden(const fs::path& path) const {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesW(path.c_str());
    return (attrs != INVALID_FILE_ATTRIBUTES) &&
           (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
    return path.filename().string().starts_with(".");
#endif
}

bool FilesystemHierarchySource::is_junk_file(const std::string& name) const {
    static const std::unordered_set<std::string> junk = {
        ".DS_Store", "Thumbs.db", "desktop.ini"
    };
    return junk.contains(name);
}

std::optional<HierarchyEntry> FilesystemHierarchySource::build_entry(const fs::directory_entry& entry,
                                                                     const std::string& parent_path,
                                                                     const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    const std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (should_skip_entry(entry_path, file_name, context)) {
        return std::nullopt;
    }

    const auto type = classify_entry(entry, context);
    if (!type) {
        return std::nullopt;
    }

    HierarchyEntry result;
    result.path = Utils::join_path(parent_path, file_name);
    result.name = file_name;
    result.type = *type;

    std::error_code ec;
    if (*type == NodeType::File) {
        const auto size = entry.file_size(ec);
        result.size = ec ? 0 : size;
    }
    const auto write_time = entry.last_write_time(ec);
    result.modified_time = ec ? 0 : to_epoch_ms(write_time);
    return result;
}

bool FilesystemHierarchySource::should_skip_entry(const fs::path& entry_path,
                                                  const std::string& file_name,
                                                  const ScanContext& context) const
{
    if (is_junk_file(file_name)) {
        return true;
    }

    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", Utils::path_to_utf8(entry_path));
        }
        return true;
    }

    return false;
}

std::optional<NodeType> FilesystemHierarchySource::classify_entry(const fs::directory_entry& entry,
                                                                  const ScanContext& context) const
{
    std::error_code ec;
    if (entry.is_symlink(ec) && entry.is_directory(ec)) {
        if (context.logger) {
            context.logger->trace("Skipping directory link '{}'", Utils::path_to_utf8(entry.path()));
        }
        return std::nullopt;
    }
    if (context.include_directories && entry.is_directory(ec)) {
        return NodeType::Folder;
    }
    if (context.include_files && entry.is_regular_file(ec)) {
        return NodeType::File;
    }
    return std::nullopt;
}
