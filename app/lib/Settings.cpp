#include "Settings.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr int kMinDebounceMs = 0;
constexpr int kMaxDebounceMs = 10000;

int clamp_positive(int value, int fallback)
{
    return value > 0 ? value : fallback;
}
}


Settings::Settings()
{
    config_path = define_config_path();

    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }
}


std::string Settings::define_config_path()
{
    std::string AppName = "DualPaneTree";
    if (const char* override_root = std::getenv("DUALPANE_TREE_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + AppName + "\\config.ini";
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + AppName + "/config.ini";
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + AppName + "/config.ini";
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


std::string Settings::section_for(PaneId pane)
{
    return pane == PaneId::Left ? "LeftPane" : "RightPane";
}


PaneConfig Settings::read_pane(const std::string& section) const
{
    const PaneConfig defaults;
    PaneConfig pane;
    pane.show_files_in_tree = config.getBool(section, "ShowFilesInTree", defaults.show_files_in_tree);
    pane.max_render_depth = clamp_positive(
        config.getInt(section, "MaxRenderDepth", defaults.max_render_depth), defaults.max_render_depth);
    pane.sort_by = sort_criterion_from_string(config.getValue(section, "SortBy", to_string(defaults.sort_by)));
    pane.case_sensitive_search = config.getBool(section, "CaseSensitiveSearch", defaults.case_sensitive_search);
    pane.search_mode = search_mode_from_string(config.getValue(section, "SearchMode", to_string(defaults.search_mode)));
    pane.search_debounce_ms = std::clamp(
        config.getInt(section, "SearchDebounceMs", defaults.search_debounce_ms), kMinDebounceMs, kMaxDebounceMs);
    pane.change_debounce_ms = std::clamp(
        config.getInt(section, "ChangeDebounceMs", defaults.change_debounce_ms), kMinDebounceMs, kMaxDebounceMs);
    pane.max_focus_history = clamp_positive(
        config.getInt(section, "MaxFocusHistory", defaults.max_focus_history), defaults.max_focus_history);
    pane.expand_all_depth = clamp_positive(
        config.getInt(section, "ExpandAllDepth", defaults.expand_all_depth), defaults.expand_all_depth);
    return pane;
}


void Settings::write_pane(const std::string& section, const PaneConfig& pane)
{
    config.setBool(section, "ShowFilesInTree", pane.show_files_in_tree);
    config.setInt(section, "MaxRenderDepth", pane.max_render_depth);
    config.setValue(section, "SortBy", to_string(pane.sort_by));
    config.setBool(section, "CaseSensitiveSearch", pane.case_sensitive_search);
    config.setValue(section, "SearchMode", to_string(pane.search_mode));
    config.setInt(section, "SearchDebounceMs", pane.search_debounce_ms);
    config.setInt(section, "ChangeDebounceMs", pane.change_debounce_ms);
    config.setInt(section, "MaxFocusHistory", pane.max_focus_history);
    config.setInt(section, "ExpandAllDepth", pane.expand_all_depth);
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        left_pane = PaneConfig{};
        right_pane = PaneConfig{};
        active_pane = PaneId::Left;
        return false;
    }

    left_pane = read_pane(section_for(PaneId::Left));
    right_pane = read_pane(section_for(PaneId::Right));
    active_pane = pane_id_from_string(config.getValue("General", "ActivePane", "left"));
    return true;
}


bool Settings::save()
{
    write_pane(section_for(PaneId::Left), left_pane);
    write_pane(section_for(PaneId::Right), right_pane);
    config.setValue("General", "ActivePane", to_string(active_pane));

    if (!config.save(config_path)) {
        settings_log(spdlog::level::err, "Failed to save settings to {}", config_path);
        return false;
    }
    return true;
}


PaneConfig Settings::get_pane_config(PaneId pane) const
{
    return pane == PaneId::Left ? left_pane : right_pane;
}


void Settings::set_pane_config(PaneId pane, const PaneConfig& config_value)
{
    if (pane == PaneId::Left) {
        left_pane = config_value;
    } else {
        right_pane = config_value;
    }
}


PaneId Settings::get_active_pane() const
{
    return active_pane;
}


void Settings::set_active_pane(PaneId pane)
{
    active_pane = pane;
}
