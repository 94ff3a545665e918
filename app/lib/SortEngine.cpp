#include "SortEngine.hpp"

#include <QString>
#include <QStringView>

#include <algorithm>

namespace {
int sign(int value)
{
    return (value > 0) - (value < 0);
}

template <typename T>
int descending(T a, T b)
{
    if (a == b) {
        return 0;
    }
    return a > b ? -1 : 1;
}

qsizetype run_end(const QString& text, qsizetype start, bool digits)
{
    qsizetype pos = start;
    while (pos < text.size() && text.at(pos).isDigit() == digits) {
        ++pos;
    }
    return pos;
}

int compare_digit_runs(QStringView a, QStringView b)
{
    auto strip = [](QStringView run) {
        qsizetype zeros = 0;
        while (zeros + 1 < run.size() && run.at(zeros) == QLatin1Char('0')) {
            ++zeros;
        }
        return run.mid(zeros);
    };
    const QStringView left = strip(a);
    const QStringView right = strip(b);
    if (left.size() != right.size()) {
        return left.size() < right.size() ? -1 : 1;
    }
    return sign(left.compare(right));
}
}

SortEngine::SortEngine(const QLocale& locale)
    : collator_(locale)
{
    collator_.setCaseSensitivity(Qt::CaseInsensitive);
    collator_.setIgnorePunctuation(false);
}

int SortEngine::collate(const QString& a, const QString& b) const
{
    return sign(collator_.compare(a, b));
}

int SortEngine::compare_names(const std::string& a, const std::string& b) const
{
    const QString left = QString::fromStdString(a);
    const QString right = QString::fromStdString(b);

    qsizetype i = 0;
    qsizetype j = 0;
    while (i < left.size() && j < right.size()) {
        const bool left_digit = left.at(i).isDigit();
        const bool right_digit = right.at(j).isDigit();
        if (left_digit != right_digit) {
            const int result = collate(left.mid(i), right.mid(j));
            if (result != 0) {
                return result;
            }
            break;
        }
        const qsizetype left_end = run_end(left, i, left_digit);
        const qsizetype right_end = run_end(right, j, right_digit);
        const QStringView left_run = QStringView(left).mid(i, left_end - i);
        const QStringView right_run = QStringView(right).mid(j, right_end - j);
        const int result = left_digit
            ? compare_digit_runs(left_run, right_run)
            : collate(left_run.toString(), right_run.toString());
        if (result != 0) {
            return result;
        }
        i = left_end;
        j = right_end;
    }

    const bool left_done = i >= left.size();
    const bool right_done = j >= right.size();
    if (left_done != right_done) {
        return left_done ? -1 : 1;
    }
    return sign(a.compare(b));
}

int SortEngine::compare(const HierarchyEntry& a, const HierarchyEntry& b, SortCriterion criterion) const
{
    const bool a_folder = a.is_container();
    const bool b_folder = b.is_container();
    if (a_folder && !b_folder) return -1;
    if (!a_folder && b_folder) return 1;

    int result = 0;
    switch (criterion) {
        case SortCriterion::Modified:
            result = descending(a_folder ? 0 : a.modified_time, b_folder ? 0 : b.modified_time);
            break;
        case SortCriterion::Size:
            if (!a_folder && !b_folder) {
                result = descending(a.size, b.size);
            }
            break;
        case SortCriterion::Name:
        default:
            break;
    }
    if (result != 0) {
        return result;
    }

    result = compare_names(a.name, b.name);
    if (result != 0) {
        return result;
    }
    return sign(a.path.compare(b.path));
}

void SortEngine::sort_entries(std::vector<EntryPtr>& entries, SortCriterion criterion) const
{
    std::stable_sort(entries.begin(), entries.end(),
                     [this, criterion](const EntryPtr& a, const EntryPtr& b) {
                         return compare(*a, *b, criterion) < 0;
                     });
}

void SortEngine::sort_nodes(std::vector<TreeNodePtr>& nodes, SortCriterion criterion) const
{
    std::stable_sort(nodes.begin(), nodes.end(),
                     [this, criterion](const TreeNodePtr& a, const TreeNodePtr& b) {
                         return compare(*a->item, *b->item, criterion) < 0;
                     });
}
