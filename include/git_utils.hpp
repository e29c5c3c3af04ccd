#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application (and once per test
 * that touches libgit2). Initialization is reference counted by libgit2.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

/**
 * @brief Where fetch credentials come from.
 *
 * Empty paths are skipped. `GIT_USERNAME`/`GIT_PASSWORD` from the
 * environment and the SSH agent are always consulted.
 */
struct CredentialSource {
    fs::path credential_file; ///< Username on line one, password on line two
    fs::path ssh_public_key;
    fs::path ssh_private_key;
};

/// Outcome of @ref fetch_and_reset.
enum SyncResult {
    SYNC_OK = 0,        ///< HEAD moved to the fetched commit
    SYNC_UP_TO_DATE,    ///< Reset performed, HEAD already matched
    SYNC_OPEN_FAILED,   ///< Not a repository or unreadable
    SYNC_FETCH_FAILED,  ///< Remote lookup or network fetch failed; no reset
    SYNC_RESET_FAILED   ///< Fetch succeeded but FETCH_HEAD could not be applied
};

/** @return Short lowercase name for @p r, used as a log field. */
const char* sync_result_label(SyncResult r);

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal hash or `std::nullopt` on error
 *         (including an unborn branch).
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Check the working tree for pending modifications.
 *
 * Staged, unstaged and untracked entries all count; ignored files do not.
 * This is the set `git status --porcelain` prints.
 *
 * @param repo  Path inside a Git working tree (parents are searched).
 * @param error Optional output string receiving a libgit2 error message.
 * @return `true` if dirty, `false` if clean, `std::nullopt` if the status
 *         could not be read.
 */
std::optional<bool> working_tree_dirty(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Fetch one branch and hard-reset the working tree to it.
 *
 * Equivalent to `git fetch <remote> <branch> && git reset --hard FETCH_HEAD`.
 * @p remote may name a configured remote or be a URL. The reset only runs
 * when the fetch succeeded. Local commits not on the fetched branch and
 * modifications to tracked files are discarded; untracked files are kept.
 *
 * @param repo            Path inside a Git working tree (parents are searched).
 * @param remote          Remote name or URL.
 * @param branch          Branch on the remote, without `refs/heads/`.
 * @param out_log         Receives a short description of what happened.
 * @param creds           Credential sources, `nullptr` disables the
 *                        credential callback.
 * @param auth_failed     Optional output flag set when authentication fails.
 * @return One of @ref SyncResult.
 */
SyncResult fetch_and_reset(const fs::path& repo, const std::string& remote,
                           const std::string& branch, std::string& out_log,
                           const CredentialSource* creds = nullptr, bool* auth_failed = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
