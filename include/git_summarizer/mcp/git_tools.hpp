#pragma once

#include <git_summarizer/config/server_config.hpp>
#include <git_summarizer/git/i_git_backend.hpp>
#include <git_summarizer/mcp/tool_registry.hpp>

#include <string>

namespace git_summarizer {

constexpr const char* kGetStagedDiffTool = "get_staged_diff";
constexpr const char* kExecuteCommitTool = "execute_commit";

// Description of get_staged_diff with the given commit template embedded.
std::string StagedDiffDescription(const std::string& commit_format);

// Register get_staged_diff and execute_commit. Handlers capture the backend
// by reference and the description provider captures the config by
// reference; both must outlive the registry.
void RegisterGitTools(ToolRegistry& registry, IGitBackend& backend,
                      const ServerConfig& config);

} // namespace git_summarizer
