#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <string>

/**
 * @brief Per-pane tree preferences stored under [LeftPane] / [RightPane].
 */
struct PaneConfig {
    bool show_files_in_tree{false};
    int max_render_depth{50};
    SortCriterion sort_by{SortCriterion::Name};
    bool case_sensitive_search{false};
    SearchMode search_mode{SearchMode::Plain};
    int search_debounce_ms{300};
    int change_debounce_ms{100};
    int max_focus_history{50};
    int expand_all_depth{50};
};


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    PaneConfig get_pane_config(PaneId pane) const;
    void set_pane_config(PaneId pane, const PaneConfig& config);

    PaneId get_active_pane() const;
    void set_active_pane(PaneId pane);

    std::string define_config_path();
    std::string get_config_dir();
    const std::string& get_config_path() const { return config_path; }

private:
    static std::string section_for(PaneId pane);
    PaneConfig read_pane(const std::string& section) const;
    void write_pane(const std::string& section, const PaneConfig& pane);

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    PaneConfig left_pane;
    PaneConfig right_pane;
    PaneId active_pane{PaneId::Left};
};

#endif
