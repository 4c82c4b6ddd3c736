#include <git_summarizer/config/server_config.hpp>

#include <utility>

namespace git_summarizer {

const char* const kDefaultCommitFormat =
    R"(<type>[optional scope]: <english description>

[English body]

[Chinese body]

Log: [short description of the change use chinese language]
PMS: <BUG-number>(for bugfix) or <TASK-number>(for add feature) (Must include 'BUG-' or 'TASK-', If the user does not provide a number, remove this line.)
Influence: Explain in Chinese the potential impact of this submission.)";

ServerConfig::ServerConfig() : ServerConfig(kDefaultCommitFormat) {}

ServerConfig::ServerConfig(std::string commit_format)
    : settings_{std::move(commit_format)} {}

ServerSettings ServerConfig::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void ServerConfig::SetCommitFormat(std::string commit_format) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.commit_format = std::move(commit_format);
}

} // namespace git_summarizer
