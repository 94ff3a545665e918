#ifndef DUAL_PANE_MANAGER_HPP
#define DUAL_PANE_MANAGER_HPP

#include "FolderCountCache.hpp"
#include "HierarchySource.hpp"
#include "Settings.hpp"
#include "TreePane.hpp"
#include "Types.hpp"

#include <cstddef>
#include <string>

/**
 * @brief Left and right panes over one hierarchy source.
 *
 * The folder count cache is shared: each change notice updates it once and
 * is then forwarded to both panes.
 */
class DualPaneManager {
public:
    DualPaneManager(HierarchySource& source,
                    const PaneConfig& left_config = {},
                    const PaneConfig& right_config = {},
                    PaneId active = PaneId::Left);
    ~DualPaneManager();

    DualPaneManager(const DualPaneManager&) = delete;
    DualPaneManager& operator=(const DualPaneManager&) = delete;

    /// Counts the hierarchy (0 for no node budget) and builds both panes.
    void initialize(std::size_t count_budget = 0);

    TreePane& pane(PaneId id);
    const TreePane& pane(PaneId id) const;
    TreePane& left() { return left_; }
    TreePane& right() { return right_; }
    TreePane& active() { return pane(active_); }

    PaneId active_pane() const { return active_; }
    PaneId switch_active();
    void set_active_pane(PaneId id) { active_ = id; }

    void flush_pending();

    bool load_state(const std::string& config_dir);
    bool save_state(const std::string& config_dir) const;

    const FolderCountCache& counts() const { return counts_; }

private:
    void handle_change(const ChangeNotice& notice);

    HierarchySource& source_;
    FolderCountCache counts_;
    TreePane left_;
    TreePane right_;
    PaneId active_;
    std::size_t listener_token_{0};
};

#endif
