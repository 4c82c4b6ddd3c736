#pragma once

#include <git_summarizer/core/result.hpp>

#include <string>
#include <string_view>

namespace git_summarizer {

// Message returned when the index holds no changes relative to HEAD.
// Shown verbatim to the agent as the get_staged_diff error text.
extern const char* const kNoStagedChangesMessage;

// ---------------------------------------------------------------------------
// IGitBackend — the version-control collaborator behind the MCP tools.
//
// The protocol engine only talks to this interface; LibGit2Backend is the
// production implementation and MockGitBackend the test double.
//
// Methods return Result<T, Error> — never throw on expected failures.
// ---------------------------------------------------------------------------
class IGitBackend {
public:
    virtual ~IGitBackend() = default;

    // Non-copyable, non-movable (polymorphic base).
    IGitBackend(const IGitBackend&) = delete;
    IGitBackend& operator=(const IGitBackend&) = delete;
    IGitBackend(IGitBackend&&) = delete;
    IGitBackend& operator=(IGitBackend&&) = delete;

    // Patch text of the index against HEAD. Fails with
    // ErrorCategory::NoStagedChanges when nothing is staged.
    [[nodiscard]] virtual Result<std::string, Error> GetStagedDiff() = 0;

    // Commit the current index on top of HEAD (no parent for the initial
    // commit). Returns a confirmation naming the new commit id. The message
    // is passed through unvalidated; an empty message is allowed.
    [[nodiscard]] virtual Result<std::string, Error> Commit(
        std::string_view message) = 0;

protected:
    IGitBackend() = default;
};

} // namespace git_summarizer
