#pragma once

#include <git_summarizer/git/i_git_backend.hpp>

#include <string>

namespace git_summarizer {

// ---------------------------------------------------------------------------
// LibGit2Backend — IGitBackend on top of libgit2.
//
// The repository is reopened on every call so each tool invocation sees the
// index as it is on disk right now (the user may stage more files between
// get_staged_diff and execute_commit). The path may point anywhere inside the
// working tree; the repository is discovered upwards from it.
//
// Holds a libgit2 init reference for its lifetime.
// ---------------------------------------------------------------------------
class LibGit2Backend : public IGitBackend {
public:
    explicit LibGit2Backend(std::string repo_path);
    ~LibGit2Backend() override;

    [[nodiscard]] Result<std::string, Error> GetStagedDiff() override;
    [[nodiscard]] Result<std::string, Error> Commit(
        std::string_view message) override;

    // Working directory of the discovered repository. Used at startup to
    // report which repository the server operates on.
    [[nodiscard]] Result<std::string, Error> WorkingDirectory();

    [[nodiscard]] const std::string& RepoPath() const noexcept {
        return repo_path_;
    }

private:
    std::string repo_path_;
};

} // namespace git_summarizer
