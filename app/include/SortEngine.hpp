#ifndef SORT_ENGINE_HPP
#define SORT_ENGINE_HPP

#include "HierarchySource.hpp"
#include "TreeNode.hpp"
#include "Types.hpp"

#include <QCollator>
#include <QLocale>

#include <string>
#include <vector>

/**
 * @brief Deterministic ordering of sibling lists.
 *
 * Folders always come before files. Name comparison is locale aware and
 * numeric sensitive ("item2" before "item10"); every criterion ends in a
 * byte-wise tie break so the order is total.
 */
class SortEngine {
public:
    explicit SortEngine(const QLocale& locale = QLocale());

    /// Returns -1, 0 or 1.
    int compare(const HierarchyEntry& a, const HierarchyEntry& b, SortCriterion criterion) const;
    int compare_names(const std::string& a, const std::string& b) const;

    void sort_entries(std::vector<EntryPtr>& entries, SortCriterion criterion) const;
    void sort_nodes(std::vector<TreeNodePtr>& nodes, SortCriterion criterion) const;

private:
    int collate(const QString& a, const QString& b) const;

    QCollator collator_;
};

#endif
