#include "DualPaneManager.hpp"
#include "Logger.hpp"
#include "TreeStateStore.hpp"

DualPaneManager::DualPaneManager(HierarchySource& source,
                                 const PaneConfig& left_config,
                                 const PaneConfig& right_config,
                                 PaneId active)
    : source_(source),
      counts_(source),
      left_(PaneId::Left, source, left_config, &counts_),
      right_(PaneId::Right, source, right_config, &counts_),
      active_(active)
{
    listener_token_ = source_.add_change_listener([this](const ChangeNotice& notice) {
        handle_change(notice);
    });
}

DualPaneManager::~DualPaneManager()
{
    source_.remove_change_listener(listener_token_);
}

void DualPaneManager::initialize(std::size_t count_budget)
{
    const std::size_t visited = counts_.compute_counts(count_budget);
    if (auto logger = Logger::get_logger("tree_logger")) {
        logger->info("Counted {} entries in {} folders", visited, counts_.size());
    }
    left_.refresh();
    right_.refresh();
}

TreePane& DualPaneManager::pane(PaneId id)
{
    return id == PaneId::Left ? left_ : right_;
}

const TreePane& DualPaneManager::pane(PaneId id) const
{
    return id == PaneId::Left ? left_ : right_;
}

PaneId DualPaneManager::switch_active()
{
    active_ = active_ == PaneId::Left ? PaneId::Right : PaneId::Left;
    return active_;
}

void DualPaneManager::flush_pending()
{
    left_.flush_pending();
    right_.flush_pending();
}

void DualPaneManager::handle_change(const ChangeNotice& notice)
{
    if (auto logger = Logger::get_logger("tree_logger")) {
        logger->debug("Change notice: {} '{}'", to_string(notice.type), notice.path);
    }
    counts_.apply_change(notice);
    left_.notify_change(notice);
    right_.notify_change(notice);
}

bool DualPaneManager::load_state(const std::string& config_dir)
{
    bool ok = true;
    for (PaneId id : {PaneId::Left, PaneId::Right}) {
        TreeStateStore store(config_dir, id);
        ok = static_cast<bool>(pane(id).restore_state(store.load())) && ok;
    }
    return ok;
}

bool DualPaneManager::save_state(const std::string& config_dir) const
{
    bool ok = true;
    for (PaneId id : {PaneId::Left, PaneId::Right}) {
        TreeStateStore store(config_dir, id);
        ok = store.save(pane(id).capture_state()) && ok;
    }
    return ok;
}
