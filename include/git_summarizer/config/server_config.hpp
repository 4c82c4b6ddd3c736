#pragma once

#include <mutex>
#include <string>

namespace git_summarizer {

// Built-in commit message template shown to the agent in the get_staged_diff
// tool description until a client or the startup configuration replaces it.
extern const char* const kDefaultCommitFormat;

// ---------------------------------------------------------------------------
// ServerSettings — snapshot of the runtime-mutable server state.
// ---------------------------------------------------------------------------
struct ServerSettings {
    std::string commit_format;
};

// ---------------------------------------------------------------------------
// ServerConfig — process-wide settings shared by the dispatcher and the tool
// catalog. Owned by main() and injected by reference; every access takes the
// lock so readers never observe a torn template.
// ---------------------------------------------------------------------------
class ServerConfig {
public:
    ServerConfig();
    explicit ServerConfig(std::string commit_format);

    ServerConfig(const ServerConfig&) = delete;
    ServerConfig& operator=(const ServerConfig&) = delete;

    [[nodiscard]] ServerSettings Get() const;

    void SetCommitFormat(std::string commit_format);

private:
    mutable std::mutex mutex_;
    ServerSettings settings_;
};

} // namespace git_summarizer
