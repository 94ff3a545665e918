#ifndef HIERARCHY_SOURCE_HPP
#define HIERARCHY_SOURCE_HPP

#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using EntryPtr = std::shared_ptr<const HierarchyEntry>;

/**
 * @brief Read-only provider of the folder/file hierarchy the engine projects.
 *
 * Child listings are synchronous. children() throws SourceUnavailableError
 * when a container cannot be read (for example when it was deleted
 * concurrently).
 */
class HierarchySource {
public:
    using ChangeListener = std::function<void(const ChangeNotice&)>;

    virtual ~HierarchySource() = default;

    virtual EntryPtr root() const = 0;
    virtual EntryPtr resolve(const std::string& path) const = 0;
    virtual std::vector<EntryPtr> children(const std::string& path) const = 0;

    bool is_container(const std::string& path) const;

    std::size_t add_change_listener(ChangeListener listener);
    void remove_change_listener(std::size_t token);

protected:
    void notify_change(const ChangeNotice& notice) const;

private:
    std::map<std::size_t, ChangeListener> listeners_;
    std::size_t next_token_{1};
};

#endif
