#ifndef TREE_ERRORS_HPP
#define TREE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

enum class TreeErrorCode {
    None,
    SourceUnavailable,   ///< Container children could not be read.
    InvalidFocusTarget,  ///< Path does not resolve to a container.
    MalformedPattern     ///< Regex or glob failed to compile.
};

inline std::string to_string(TreeErrorCode code) {
    switch (code) {
        case TreeErrorCode::None: return "none";
        case TreeErrorCode::SourceUnavailable: return "source unavailable";
        case TreeErrorCode::InvalidFocusTarget: return "invalid focus target";
        case TreeErrorCode::MalformedPattern: return "malformed pattern";
        default: return "unknown";
    }
}

class SourceUnavailableError : public std::runtime_error {
public:
    SourceUnavailableError(const std::string& message, std::string path)
        : std::runtime_error(message), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct TreeOperationResult {
    bool success{true};
    TreeErrorCode code{TreeErrorCode::None};
    std::string message;
    std::size_t affected_items{0};

    static TreeOperationResult ok(std::size_t affected = 0) {
        TreeOperationResult result;
        result.affected_items = affected;
        return result;
    }

    static TreeOperationResult failure(TreeErrorCode code, std::string message) {
        TreeOperationResult result;
        result.success = false;
        result.code = code;
        result.message = std::move(message);
        return result;
    }

    explicit operator bool() const { return success; }
};

#endif // TREE_ERRORS_HPP
