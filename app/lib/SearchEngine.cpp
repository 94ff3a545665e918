#include "SearchEngine.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <QRegularExpression>
#include <QString>

#include <algorithm>

namespace {

QRegularExpression build_pattern(const QString& query, SearchMode mode, bool case_sensitive)
{
    QRegularExpression::PatternOptions flags = QRegularExpression::NoPatternOption;
    if (!case_sensitive) {
        flags |= QRegularExpression::CaseInsensitiveOption;
    }
    if (mode == SearchMode::Glob) {
        QRegularExpression glob(QRegularExpression::wildcardToRegularExpression(query));
        glob.setPatternOptions(glob.patternOptions() | flags);
        return glob;
    }
    return QRegularExpression(query, flags);
}

class Matcher {
public:
    Matcher(const std::string& query, const SearchOptions& options)
        : query_(QString::fromStdString(query)),
          raw_query_(query),
          options_(options)
    {
        if (options.mode == SearchMode::Plain) {
            return;
        }
        pattern_ = build_pattern(query_, options.mode, options.case_sensitive);
        if (!pattern_.isValid()) {
            fell_back_ = true;
            error_ = pattern_.errorString().toStdString();
            if (auto logger = Logger::get_logger("tree_logger")) {
                logger->warn("Search pattern '{}' is malformed ({}); using literal match",
                             query, error_);
            }
        }
    }

    bool fell_back() const { return fell_back_; }
    const std::string& error() const { return error_; }

    bool matches(const TreeNode& node) const
    {
        switch (options_.scope) {
            case SearchScope::Paths:
                return matches_text(node.path, false);
            case SearchScope::All:
                return matches_text(node.name(), true) || matches_text(node.path, false);
            case SearchScope::Names:
            default:
                return matches_text(node.name(), true);
        }
    }

    double score(const TreeNode& node) const
    {
        return SearchEngine::score(node.name(), raw_query_, options_.case_sensitive);
    }

private:
    bool matches_text(const std::string& text, bool fuzzy) const
    {
        const QString subject = QString::fromStdString(text);
        if (options_.mode != SearchMode::Plain && !fell_back_) {
            return pattern_.match(subject).hasMatch();
        }
        if (fuzzy && options_.mode == SearchMode::Plain) {
            return SearchEngine::score(text, raw_query_, options_.case_sensitive) > 0.0;
        }
        const auto sensitivity = options_.case_sensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
        return subject.contains(query_, sensitivity);
    }

    QString query_;
    std::string raw_query_;
    SearchOptions options_;
    QRegularExpression pattern_;
    bool fell_back_{false};
    std::string error_;
};

std::size_t annotate(TreeNode& node, const Matcher& matcher, bool is_root)
{
    std::size_t matches = 0;
    if (!is_root) {
        node.matches_search = matcher.matches(node);
        node.search_score = node.matches_search ? matcher.score(node) : 0.0;
        if (node.matches_search) {
            ++matches;
        }
    }
    for (auto& child : node.children) {
        matches += annotate(*child, matcher, false);
    }
    return matches;
}

bool prune(TreeNode& node)
{
    std::vector<TreeNodePtr> kept;
    kept.reserve(node.children.size());
    for (auto& child : node.children) {
        if (prune(*child)) {
            kept.push_back(std::move(child));
        }
    }
    node.children = std::move(kept);
    if (!node.children.empty()) {
        node.is_expanded = true;
    }
    return node.matches_search || !node.children.empty();
}

void collect_hits(const TreeNode& node, const Matcher& matcher,
                  std::vector<std::string>& trail, std::vector<SearchHit>& hits)
{
    const bool is_root = node.level < 0;
    if (!is_root) {
        trail.push_back(node.name());
        if (matcher.matches(node)) {
            hits.push_back(SearchHit{node.path, node.name(), matcher.score(node), trail});
        }
    }
    for (const auto& child : node.children) {
        collect_hits(*child, matcher, trail, hits);
    }
    if (!is_root) {
        trail.pop_back();
    }
}

} // namespace

double SearchEngine::score(const std::string& name, const std::string& query, bool case_sensitive)
{
    if (query.empty()) {
        return 0.0;
    }
    QString text = QString::fromStdString(name);
    QString needle = QString::fromStdString(query);
    if (!case_sensitive) {
        text = text.toLower();
        needle = needle.toLower();
    }

    if (text == needle) return kExactScore;
    if (text.startsWith(needle)) return kPrefixScore;
    if (text.contains(needle)) return kSubstringScore;

    qsizetype matched = 0;
    for (qsizetype i = 0; i < text.size() && matched < needle.size(); ++i) {
        if (text.at(i) == needle.at(matched)) {
            ++matched;
        }
    }
    return (static_cast<double>(matched) / static_cast<double>(needle.size())) * kFuzzyWeight;
}

SearchOutcome SearchEngine::filter(TreeNodePtr tree, const std::string& query,
                                   const SearchOptions& options) const
{
    SearchOutcome outcome;
    const std::string trimmed = Utils::trim_copy(query);
    if (!tree || trimmed.empty()) {
        outcome.tree = std::move(tree);
        return outcome;
    }

    const Matcher matcher(trimmed, options);
    outcome.pattern_fell_back = matcher.fell_back();
    outcome.pattern_error = matcher.error();
    outcome.match_count = annotate(*tree, matcher, true);
    if (outcome.match_count > 0) {
        prune(*tree);
    }

    if (auto logger = Logger::get_logger("tree_logger")) {
        logger->debug("Search '{}' matched {} node(s) under '{}'", trimmed, outcome.match_count, tree->path);
    }
    outcome.tree = std::move(tree);
    return outcome;
}

std::vector<SearchHit> SearchEngine::rank(const TreeNode& tree, const std::string& query,
                                          const SearchOptions& options,
                                          std::size_t max_results) const
{
    const std::string trimmed = Utils::trim_copy(query);
    if (trimmed.empty()) {
        return {};
    }
    const Matcher matcher(trimmed, options);
    std::vector<SearchHit> hits;
    std::vector<std::string> trail;
    collect_hits(tree, matcher, trail, hits);

    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        return a.score > b.score;
    });
    if (hits.size() > max_results) {
        hits.resize(max_results);
    }
    return hits;
}

std::vector<MatchRange> SearchEngine::match_ranges(const std::string& text, const std::string& query,
                                                   bool case_sensitive)
{
    std::vector<MatchRange> ranges;
    if (Utils::is_blank(query)) {
        return ranges;
    }
    const QString subject = QString::fromStdString(text);
    const QString needle = QString::fromStdString(query);
    const auto sensitivity = case_sensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;

    qsizetype index = subject.indexOf(needle, 0, sensitivity);
    while (index != -1) {
        const auto start = static_cast<std::size_t>(subject.left(index).toUtf8().size());
        const auto length = static_cast<std::size_t>(subject.mid(index, needle.size()).toUtf8().size());
        ranges.push_back(MatchRange{start, start + length});
        index = subject.indexOf(needle, index + 1, sensitivity);
    }
    return ranges;
}

std::optional<std::string> SearchEngine::validate_pattern(const std::string& pattern, SearchMode mode)
{
    if (mode == SearchMode::Plain || Utils::is_blank(pattern)) {
        return std::nullopt;
    }
    const auto compiled = build_pattern(QString::fromStdString(pattern), mode, false);
    if (compiled.isValid()) {
        return std::nullopt;
    }
    return "Invalid " + to_string(mode) + " pattern: " + compiled.errorString().toStdString();
}
