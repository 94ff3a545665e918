#include "HierarchySource.hpp"

bool HierarchySource::is_container(const std::string& path) const
{
    const auto entry = resolve(path);
    return entry && entry->is_container();
}

std::size_t HierarchySource::add_change_listener(ChangeListener listener)
{
    const std::size_t token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void HierarchySource::remove_change_listener(std::size_t token)
{
    listeners_.erase(token);
}

void HierarchySource::notify_change(const ChangeNotice& notice) const
{
    // Copy so a listener may unsubscribe while being notified.
    const auto listeners = listeners_;
    for (const auto& [token, listener] : listeners) {
        if (listener) {
            listener(notice);
        }
    }
}
