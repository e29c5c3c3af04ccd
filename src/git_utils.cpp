#include "git_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <system_error>

using namespace std;

namespace git {

namespace {

constexpr int MAX_CREDENTIAL_ATTEMPTS = 3;

struct FetchPayload {
    const CredentialSource* creds;
    int attempts;
};

struct FetchHeadMatch {
    string wanted_ref;
    git_oid oid;
    bool found;
};

bool read_credential_file(const fs::path& path, string& user, string& pass) {
    ifstream ifs(path);
    if (!ifs)
        return false;
    getline(ifs, user);
    getline(ifs, pass);
    return !user.empty() && !pass.empty();
}

optional<string> env_value(const char* name) {
    const char* v = getenv(name);
    if (v)
        return string(v);
    return nullopt;
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

string last_error_message(const char* fallback) {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return fallback;
}

void set_error(string* error) {
    if (error)
        *error = last_error_message("Unknown libgit2 error");
}

/**
 * @brief libgit2 credential callback.
 *
 * Order: SSH key from options, username only, SSH agent, credential file,
 * `GIT_USERNAME`/`GIT_PASSWORD`, default helper. Gives up after a few
 * rejected attempts so a bad password cannot spin forever.
 */
int credential_cb(git_credential** out, const char* /*url*/, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    auto* fp = static_cast<FetchPayload*>(payload);
    if (!fp || ++fp->attempts > MAX_CREDENTIAL_ATTEMPTS)
        return GIT_EUSER;
    const CredentialSource* creds = fp->creds;
    auto env_user = env_value("GIT_USERNAME");
    auto env_pass = env_value("GIT_PASSWORD");
    string file_user;
    string file_pass;
    if (creds && !creds->credential_file.empty())
        read_credential_file(creds->credential_file, file_user, file_pass);
    const char* user = username_from_url
                           ? username_from_url
                           : (!file_user.empty() ? file_user.c_str()
                                                 : (env_user ? env_user->c_str() : nullptr));
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && creds && !creds->ssh_private_key.empty() &&
        user) {
        string pub = creds->ssh_public_key.string();
        if (git_credential_ssh_key_new(out, user, pub.empty() ? nullptr : pub.c_str(),
                                       creds->ssh_private_key.string().c_str(), "") == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (!file_user.empty() && !file_pass.empty())
            return git_credential_userpass_plaintext_new(out, file_user.c_str(),
                                                         file_pass.c_str());
        if (env_user && env_pass)
            return git_credential_userpass_plaintext_new(out, env_user->c_str(),
                                                         env_pass->c_str());
    }
    return git_credential_default_new(out);
}

int fetchhead_cb(const char* ref_name, const char* /*remote_url*/, const git_oid* oid,
                 unsigned int /*is_merge*/, void* payload) {
    auto* match = static_cast<FetchHeadMatch*>(payload);
    if (ref_name && match->wanted_ref == ref_name) {
        git_oid_cpy(&match->oid, oid);
        match->found = true;
        return 1; // stop iterating
    }
    return 0;
}

// Like the git command line, a path inside the working tree (a
// subdirectory) finds the repository above it.
int open_repository(git_repository** out, const fs::path& path) {
    return git_repository_open_ext(out, path.string().c_str(), 0, nullptr);
}

// Look the remote up by name, falling back to an anonymous remote so a URL
// works the same way it does on the git command line.
git_remote* open_remote(git_repository* repo, const string& remote) {
    git_remote* raw = nullptr;
    if (git_remote_lookup(&raw, repo, remote.c_str()) == 0)
        return raw;
    if (remote.find(':') != string::npos || remote.find('/') != string::npos) {
        if (git_remote_create_anonymous(&raw, repo, remote.c_str()) == 0)
            return raw;
    }
    return nullptr;
}

} // namespace

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

const char* sync_result_label(SyncResult r) {
    switch (r) {
    case SYNC_OK:
        return "reset";
    case SYNC_UP_TO_DATE:
        return "up_to_date";
    case SYNC_OPEN_FAILED:
        return "open_failed";
    case SYNC_FETCH_FAILED:
        return "fetch_failed";
    case SYNC_RESET_FAILED:
        return "reset_failed";
    }
    return "unknown";
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (open_repository(&raw, repo) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw_repo = nullptr;
    if (open_repository(&raw_repo, repo) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

optional<bool> working_tree_dirty(const fs::path& repo, string* error) {
    git_repository* raw_repo = nullptr;
    if (open_repository(&raw_repo, repo) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

SyncResult fetch_and_reset(const fs::path& repo, const string& remote, const string& branch,
                           string& out_log, const CredentialSource* creds, bool* auth_failed) {
    git_repository* raw_repo = nullptr;
    if (open_repository(&raw_repo, repo) != 0) {
        out_log = last_error_message("Failed to open repository");
        return SYNC_OPEN_FAILED;
    }
    repo_ptr r(raw_repo);

    remote_ptr remote_handle(open_remote(r.get(), remote));
    if (!remote_handle.get()) {
        out_log = "No " + remote + " remote";
        return SYNC_FETCH_FAILED;
    }

    // A FETCH_HEAD left by an earlier fetch must not satisfy this one.
    std::error_code ec;
    fs::remove(fs::path(git_repository_path(r.get())) / "FETCH_HEAD", ec);

    string refspec = "refs/heads/" + branch;
    char* specs[] = {const_cast<char*>(refspec.c_str())};
    git_strarray refspecs = {specs, 1};
    FetchPayload payload{creds, 0};
    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    fetch_opts.update_fetchhead = 1;
    if (creds) {
        fetch_opts.callbacks.credentials = credential_cb;
        fetch_opts.callbacks.payload = &payload;
    }
    if (git_remote_fetch(remote_handle.get(), &refspecs, &fetch_opts, nullptr) != 0) {
        out_log = last_error_message("Fetch failed");
        if (auth_failed && (out_log.find("auth") != string::npos ||
                            payload.attempts > MAX_CREDENTIAL_ATTEMPTS))
            *auth_failed = true;
        return SYNC_FETCH_FAILED;
    }

    FetchHeadMatch match{refspec, {}, false};
    int rc = git_repository_fetchhead_foreach(r.get(), fetchhead_cb, &match);
    if ((rc != 0 && rc != 1) || !match.found) {
        out_log = "Couldn't find remote ref " + refspec;
        return SYNC_FETCH_FAILED;
    }

    git_oid head_oid;
    bool same = git_reference_name_to_id(&head_oid, r.get(), "HEAD") == 0 &&
                git_oid_cmp(&head_oid, &match.oid) == 0;

    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r.get(), &match.oid, GIT_OBJECT_COMMIT) != 0) {
        out_log = last_error_message("Lookup failed");
        return SYNC_RESET_FAILED;
    }
    object_ptr target(raw_target);
    git_checkout_options checkout_opts = GIT_CHECKOUT_OPTIONS_INIT;
    checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;
    if (git_reset(r.get(), target.get(), GIT_RESET_HARD, &checkout_opts) != 0) {
        out_log = last_error_message("Reset failed");
        return SYNC_RESET_FAILED;
    }
    out_log = (same ? "HEAD is now at " : "Reset to ") + oid_to_hex(match.oid);
    return same ? SYNC_UP_TO_DATE : SYNC_OK;
}

} // namespace git
