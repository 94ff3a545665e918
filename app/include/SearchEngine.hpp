#ifndef SEARCH_ENGINE_HPP
#define SEARCH_ENGINE_HPP

#include "TreeNode.hpp"
#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SearchOptions {
    bool case_sensitive{false};
    SearchMode mode{SearchMode::Plain};
    SearchScope scope{SearchScope::Names};
};

/// Half-open range in UTF-16 code units of the searched text.
struct MatchRange {
    std::size_t start{0};
    std::size_t end{0};
};

struct SearchHit {
    std::string path;
    std::string name;
    double score{0.0};
    std::vector<std::string> breadcrumb;
};

struct SearchOutcome {
    TreeNodePtr tree;
    std::size_t match_count{0};
    bool pattern_fell_back{false};
    std::string pattern_error;
};

/**
 * @brief Scores names against a query and prunes built trees to the matches.
 *
 * Scoring tiers are fixed: exact 1.0, prefix 0.8, substring 0.5, and an
 * in-order subsequence walk worth up to 0.3.
 */
class SearchEngine {
public:
    static constexpr double kExactScore = 1.0;
    static constexpr double kPrefixScore = 0.8;
    static constexpr double kSubstringScore = 0.5;
    static constexpr double kFuzzyWeight = 0.3;

    static double score(const std::string& name, const std::string& query, bool case_sensitive = false);

    /**
     * @brief Keeps matching nodes and every ancestor of a match.
     *
     * Kept ancestors are force-expanded. A blank query, or a query nothing
     * matches, hands the tree back untouched. A malformed regex or glob
     * falls back to literal substring matching.
     */
    SearchOutcome filter(TreeNodePtr tree, const std::string& query,
                         const SearchOptions& options = {}) const;

    std::vector<SearchHit> rank(const TreeNode& tree, const std::string& query,
                                const SearchOptions& options = {},
                                std::size_t max_results = 100) const;

    /// Byte offsets of each occurrence of @p query in the UTF-8 @p text.
    static std::vector<MatchRange> match_ranges(const std::string& text, const std::string& query,
                                                bool case_sensitive = false);

    /// Error text for an invalid regex or glob, nothing when the pattern compiles.
    static std::optional<std::string> validate_pattern(const std::string& pattern, SearchMode mode);
};

#endif
