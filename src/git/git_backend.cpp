#include <git_summarizer/git/git_backend.hpp>

#include <git_summarizer/core/log.hpp>

#include <git2.h>

#include <memory>
#include <optional>
#include <utility>

namespace git_summarizer {

const char* const kNoStagedChangesMessage = "没有发现已暂存的变更。";

namespace {

constexpr const char* kLogComponent = "git";

// ---------------------------------------------------------------------------
// RAII handles for libgit2 objects.
// ---------------------------------------------------------------------------
template <typename T, void (*FreeFn)(T*)>
struct GitDeleter {
    void operator()(T* ptr) const noexcept {
        if (ptr != nullptr) {
            FreeFn(ptr);
        }
    }
};

using RepositoryPtr =
    std::unique_ptr<git_repository, GitDeleter<git_repository, git_repository_free>>;
using ReferencePtr =
    std::unique_ptr<git_reference, GitDeleter<git_reference, git_reference_free>>;
using TreePtr = std::unique_ptr<git_tree, GitDeleter<git_tree, git_tree_free>>;
using CommitPtr = std::unique_ptr<git_commit, GitDeleter<git_commit, git_commit_free>>;
using IndexPtr = std::unique_ptr<git_index, GitDeleter<git_index, git_index_free>>;
using DiffPtr = std::unique_ptr<git_diff, GitDeleter<git_diff, git_diff_free>>;
using SignaturePtr =
    std::unique_ptr<git_signature, GitDeleter<git_signature, git_signature_free>>;

// git_buf is a plain struct, not a heap object.
class ScopedBuf {
public:
    ScopedBuf() = default;
    ~ScopedBuf() { git_buf_dispose(&buf_); }

    ScopedBuf(const ScopedBuf&) = delete;
    ScopedBuf& operator=(const ScopedBuf&) = delete;

    git_buf* Get() { return &buf_; }
    [[nodiscard]] std::string ToString() const {
        if (buf_.ptr == nullptr) return {};
        return std::string(buf_.ptr, buf_.size);
    }

private:
    git_buf buf_{};
};

// Build an Error from the thread-local libgit2 error state.
Error MakeGitError(const std::string& operation, int code,
                   ErrorCategory category) {
    const git_error* last = git_error_last();
    std::optional<int> klass;
    std::string message;
    if (last != nullptr && last->message != nullptr) {
        message = last->message;
        klass = last->klass;
    } else {
        message = "libgit2 returned " + std::to_string(code);
    }
    return Error{operation, std::move(message), klass, category};
}

Result<RepositoryPtr, Error> OpenRepository(const std::string& operation,
                                            const std::string& path) {
    git_repository* raw = nullptr;
    // flags = 0: search parent directories like the git CLI does.
    int rc = git_repository_open_ext(&raw, path.c_str(), 0, nullptr);
    if (rc != 0) {
        return Result<RepositoryPtr, Error>::Err(
            MakeGitError(operation, rc, ErrorCategory::Repository));
    }
    return Result<RepositoryPtr, Error>::Ok(RepositoryPtr(raw));
}

// Tree of the commit HEAD points at. Null for an unborn HEAD (fresh
// repository) or any other failure to resolve it: the diff is then taken
// against the empty tree.
TreePtr PeelHeadTree(git_repository* repo) {
    git_reference* raw_ref = nullptr;
    if (git_repository_head(&raw_ref, repo) != 0) {
        return nullptr;
    }
    ReferencePtr head(raw_ref);

    git_object* raw_tree = nullptr;
    if (git_reference_peel(&raw_tree, head.get(), GIT_OBJECT_TREE) != 0) {
        return nullptr;
    }
    return TreePtr(reinterpret_cast<git_tree*>(raw_tree));
}

// Commit HEAD points at, or null when there is none (initial commit).
CommitPtr LookupHeadCommit(git_repository* repo) {
    git_oid head_id;
    if (git_reference_name_to_id(&head_id, repo, "HEAD") != 0) {
        return nullptr;
    }
    git_commit* raw = nullptr;
    if (git_commit_lookup(&raw, repo, &head_id) != 0) {
        return nullptr;
    }
    return CommitPtr(raw);
}

} // anonymous namespace

LibGit2Backend::LibGit2Backend(std::string repo_path)
    : repo_path_(std::move(repo_path)) {
    git_libgit2_init();
}

LibGit2Backend::~LibGit2Backend() {
    git_libgit2_shutdown();
}

// ---------------------------------------------------------------------------
// GetStagedDiff
// ---------------------------------------------------------------------------
Result<std::string, Error> LibGit2Backend::GetStagedDiff() {
    const std::string op = "GetStagedDiff";

    auto repo_result = OpenRepository(op, repo_path_);
    if (repo_result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(repo_result).Error());
    }
    auto repo = std::move(repo_result).Value();

    auto head_tree = PeelHeadTree(repo.get());

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    git_diff* raw_diff = nullptr;
    int rc = git_diff_tree_to_index(&raw_diff, repo.get(), head_tree.get(),
                                    nullptr, &opts);
    if (rc != 0) {
        return Result<std::string, Error>::Err(
            MakeGitError(op, rc, ErrorCategory::Repository));
    }
    DiffPtr diff(raw_diff);

    ScopedBuf patch;
    rc = git_diff_to_buf(patch.Get(), diff.get(), GIT_DIFF_FORMAT_PATCH);
    if (rc != 0) {
        return Result<std::string, Error>::Err(
            MakeGitError(op, rc, ErrorCategory::Repository));
    }

    auto text = patch.ToString();
    if (text.empty()) {
        return Result<std::string, Error>::Err(Error{
            op, kNoStagedChangesMessage, std::nullopt,
            ErrorCategory::NoStagedChanges});
    }

    LogDebug(kLogComponent, "staged diff: " + std::to_string(text.size()) +
                                " bytes, " +
                                std::to_string(git_diff_num_deltas(diff.get())) +
                                " file(s)");
    return Result<std::string, Error>::Ok(std::move(text));
}

// ---------------------------------------------------------------------------
// Commit
// ---------------------------------------------------------------------------
Result<std::string, Error> LibGit2Backend::Commit(std::string_view message) {
    const std::string op = "Commit";
    auto fail = [&op](int rc) {
        return Result<std::string, Error>::Err(
            MakeGitError(op, rc, ErrorCategory::Commit));
    };

    auto repo_result = OpenRepository(op, repo_path_);
    if (repo_result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(repo_result).Error());
    }
    auto repo = std::move(repo_result).Value();

    git_index* raw_index = nullptr;
    int rc = git_repository_index(&raw_index, repo.get());
    if (rc != 0) return fail(rc);
    IndexPtr index(raw_index);

    git_oid tree_id;
    rc = git_index_write_tree(&tree_id, index.get());
    if (rc != 0) return fail(rc);

    git_tree* raw_tree = nullptr;
    rc = git_tree_lookup(&raw_tree, repo.get(), &tree_id);
    if (rc != 0) return fail(rc);
    TreePtr tree(raw_tree);

    // Identity from user.name / user.email.
    git_signature* raw_sig = nullptr;
    rc = git_signature_default(&raw_sig, repo.get());
    if (rc != 0) return fail(rc);
    SignaturePtr signature(raw_sig);

    auto parent = LookupHeadCommit(repo.get());
    const std::string message_str(message);

    git_oid commit_id;
    if (parent) {
        rc = git_commit_create_v(&commit_id, repo.get(), "HEAD",
                                 signature.get(), signature.get(), nullptr,
                                 message_str.c_str(), tree.get(), 1,
                                 parent.get());
    } else {
        rc = git_commit_create_v(&commit_id, repo.get(), "HEAD",
                                 signature.get(), signature.get(), nullptr,
                                 message_str.c_str(), tree.get(), 0);
    }
    if (rc != 0) return fail(rc);

    std::string id_hex = git_oid_tostr_s(&commit_id);
    LogInfo(kLogComponent, "created commit " + id_hex +
                               (parent ? "" : " (root commit)"));
    return Result<std::string, Error>::Ok("Commit successful: " + id_hex);
}

// ---------------------------------------------------------------------------
// WorkingDirectory
// ---------------------------------------------------------------------------
Result<std::string, Error> LibGit2Backend::WorkingDirectory() {
    auto repo_result = OpenRepository("OpenRepository", repo_path_);
    if (repo_result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(repo_result).Error());
    }
    auto repo = std::move(repo_result).Value();

    const char* workdir = git_repository_workdir(repo.get());
    if (workdir == nullptr) {
        // Bare repository: nothing can be staged from a working tree.
        return Result<std::string, Error>::Err(Error{
            "OpenRepository", "repository at '" + repo_path_ + "' is bare",
            std::nullopt, ErrorCategory::Repository});
    }
    return Result<std::string, Error>::Ok(std::string(workdir));
}

} // namespace git_summarizer
