#include <git_summarizer/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace git_summarizer {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:          return 1;
        case ErrorCategory::Repository:      return 2;
        case ErrorCategory::NoStagedChanges: return 2;
        case ErrorCategory::Commit:          return 2;
        case ErrorCategory::Protocol:        return 3;
        case ErrorCategory::Io:              return 3;
        case ErrorCategory::Internal:        return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:          return "config";
        case ErrorCategory::Repository:      return "repository";
        case ErrorCategory::NoStagedChanges: return "no_staged_changes";
        case ErrorCategory::Commit:          return "commit";
        case ErrorCategory::Protocol:        return "protocol";
        case ErrorCategory::Io:              return "io";
        case ErrorCategory::Internal:        return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << ": " << message;
    if (git_error_class.has_value()) {
        oss << " (libgit2 class " << *git_error_class << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (git_error_class.has_value()) {
        body["git_error_class"] = *git_error_class;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace git_summarizer
