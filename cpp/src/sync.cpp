#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <string>
#include <vector>

namespace gitshort {
namespace sync {

namespace {

// ---------------------------------------------------------------------------
// Transport callbacks
// ---------------------------------------------------------------------------

struct CallbackState {
    std::string rejected_ref;    ///< Ref the remote refused, if any.
    std::string rejected_status; ///< Remote's reason for refusing it.
    int         credential_attempts = 0;
};

int on_push_update_reference(const char* refname, const char* status,
                             void* payload) {
    if (status) {
        auto* state = static_cast<CallbackState*>(payload);
        state->rejected_ref    = refname ? refname : "";
        state->rejected_status = status;
    }
    return 0;
}

/// Return true if hostname contains only safe characters.
bool hostname_safe(const std::string& h) {
    for (char c : h) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-')
            return false;
    }
    return !h.empty();
}

/// Ask `git credential fill` for a username/password for an https URL.
bool credential_fill(const std::string& url,
                     std::string& username, std::string& password) {
    if (url.compare(0, 8, "https://") != 0) return false;

    auto after_scheme = url.substr(8);
    auto authority = after_scheme.substr(0, after_scheme.find('/'));
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    auto hostname = authority.substr(0, authority.find(':'));

    // The hostname is spliced into a shell command line.
    if (!hostname_safe(hostname)) return false;

    std::string cmd = "printf 'protocol=https\\nhost=" + hostname +
                      "\\n\\n' | GIT_TERMINAL_PROMPT=0 git credential fill 2>/dev/null";
    auto result = proc::run(cmd);
    if (result.status != 0) return false;

    for (const auto& line : proc::lines(result.out)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = line.substr(0, eq);
        if (key == "username") username = line.substr(eq + 1);
        if (key == "password") password = line.substr(eq + 1);
    }
    return !username.empty() && !password.empty();
}

int on_credentials(git_credential** out, const char* url,
                   const char* username_from_url, unsigned int allowed_types,
                   void* payload) {
    auto* state = static_cast<CallbackState*>(payload);
    // libgit2 asks again after a rejected credential; do not loop.
    if (++state->credential_attempts > 1) return GIT_EAUTH;

    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        return git_credential_ssh_key_from_agent(
            out, username_from_url ? username_from_url : "git");
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        std::string username, password;
        try {
            if (credential_fill(url ? url : "", username, password)) {
                return git_credential_userpass_plaintext_new(
                    out, username.c_str(), password.c_str());
            }
        } catch (const IoError& e) {
            spdlog::debug("git credential fill unavailable: {}", e.what());
        }
    }
    return GIT_PASSTHROUGH;
}

void init_callbacks(git_remote_callbacks& cbs, CallbackState& state) {
    cbs.push_update_reference = on_push_update_reference;
    cbs.credentials           = on_credentials;
    cbs.payload               = &state;
}

// ---------------------------------------------------------------------------
// Remote operations
// ---------------------------------------------------------------------------

std::string tracking_ref(const RecordStoreInner& inner) {
    return "refs/remotes/" + inner.remote + "/" + inner.branch;
}

git_remote* open_remote(RecordStoreInner& inner) {
    git_remote* remote = nullptr;
    if (git_remote_lookup(&remote, inner.repo, inner.remote.c_str()) != 0) {
        throw SyncError("remote '" + inner.remote + "': " + git::last_error());
    }
    return remote;
}

struct PushAttempt {
    bool        ok = false;
    bool        non_fast_forward = false;
    std::string error;
};

PushAttempt push_branch(RecordStoreInner& inner) {
    git::RemoteGuard remote{open_remote(inner)};

    std::string spec = inner.branch_ref() + ":" + inner.branch_ref();
    std::vector<char*> refspec_ptrs{const_cast<char*>(spec.c_str())};
    git_strarray arr;
    arr.strings = refspec_ptrs.data();
    arr.count = refspec_ptrs.size();

    CallbackState state;
    git_push_options push_opts;
    git_push_options_init(&push_opts, GIT_PUSH_OPTIONS_VERSION);
    init_callbacks(push_opts.callbacks, state);

    PushAttempt attempt;
    int rc = git_remote_push(remote.r, &arr, &push_opts);
    if (rc == GIT_ENONFASTFORWARD) {
        attempt.non_fast_forward = true;
        attempt.error = git::last_error("non-fast-forward");
        return attempt;
    }
    if (rc != 0) {
        attempt.error = git::last_error();
        // Some transports report a rejected update only in the message.
        attempt.non_fast_forward =
            attempt.error.find("fastforward") != std::string::npos ||
            attempt.error.find("not present locally") != std::string::npos;
        return attempt;
    }
    if (!state.rejected_status.empty()) {
        const auto& s = state.rejected_status;
        attempt.non_fast_forward = s.find("fast-forward") != std::string::npos ||
                                   s.find("fast forward") != std::string::npos ||
                                   s.find("fetch first")  != std::string::npos;
        attempt.error = state.rejected_ref + ": " + s;
        return attempt;
    }
    attempt.ok = true;
    return attempt;
}

void fetch_branch(RecordStoreInner& inner) {
    git::RemoteGuard remote{open_remote(inner)};

    std::string spec = "+" + inner.branch_ref() + ":" + tracking_ref(inner);
    std::vector<char*> refspec_ptrs{const_cast<char*>(spec.c_str())};
    git_strarray arr;
    arr.strings = refspec_ptrs.data();
    arr.count = refspec_ptrs.size();

    CallbackState state;
    git_fetch_options fetch_opts;
    git_fetch_options_init(&fetch_opts, GIT_FETCH_OPTIONS_VERSION);
    init_callbacks(fetch_opts.callbacks, state);

    if (git_remote_fetch(remote.r, &arr, &fetch_opts, "gitshort: fetch") != 0) {
        throw SyncError("fetch of " + spec + " from '" + inner.remote +
                        "' failed: " + git::last_error());
    }
    spdlog::info("fetched {}/{}", inner.remote, inner.branch);
}

/// Check out `tree` into the working directory and index if HEAD is the
/// tracked branch. Call before moving the branch ref.
void checkout_if_head(RecordStoreInner& inner, git_object* tree) {
    git::RefGuard head;
    if (git_reference_lookup(&head.r, inner.repo, "HEAD") != 0)
        git::throw_error("git_reference_lookup (HEAD)");
    if (git_reference_type(head.r) != GIT_REFERENCE_SYMBOLIC ||
        inner.branch_ref() != git_reference_symbolic_target(head.r))
        return;

    git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
    co.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(inner.repo, tree, &co) != 0) {
        throw SyncError("cannot check out merged tree: " + git::last_error());
    }
}

/// Merge the remote-tracking branch into the tracked branch.
void merge_tracking(RecordStoreInner& inner) {
    git_repository* repo = inner.repo;
    std::string local_name  = inner.branch_ref();
    std::string remote_name = tracking_ref(inner);

    std::string theirs_hex = git::ref_target(repo, remote_name);
    if (theirs_hex.empty()) {
        throw SyncError(remote_name + " does not exist after fetch");
    }
    git_oid theirs_oid = git::hex_to_oid(theirs_hex);

    git::RefGuard local;
    if (git_reference_lookup(&local.r, repo, local_name.c_str()) != 0)
        git::throw_error("git_reference_lookup (" + local_name + ")");

    git_annotated_commit* theirs_ac = nullptr;
    if (git_annotated_commit_lookup(&theirs_ac, repo, &theirs_oid) != 0)
        git::throw_error("git_annotated_commit_lookup");
    struct AnnotatedGuard {
        git_annotated_commit* a;
        ~AnnotatedGuard() { git_annotated_commit_free(a); }
    } ag{theirs_ac};

    git_merge_analysis_t analysis;
    git_merge_preference_t preference;
    const git_annotated_commit* heads[] = {theirs_ac};
    if (git_merge_analysis_for_ref(&analysis, &preference, repo, local.r,
                                   heads, 1) != 0)
        git::throw_error("git_merge_analysis_for_ref");

    if (analysis & GIT_MERGE_ANALYSIS_UP_TO_DATE) {
        spdlog::info("{} already contains {}", inner.branch, remote_name);
        return;
    }

    git::CommitGuard theirs;
    if (git_commit_lookup(&theirs.c, repo, &theirs_oid) != 0)
        git::throw_error("git_commit_lookup (theirs)");

    if (analysis & GIT_MERGE_ANALYSIS_FASTFORWARD) {
        git::TreeGuard tree;
        if (git_commit_tree(&tree.t, theirs.c) != 0)
            git::throw_error("git_commit_tree");
        checkout_if_head(inner, reinterpret_cast<git_object*>(tree.t));

        git::RefGuard moved;
        if (git_reference_set_target(&moved.r, local.r, &theirs_oid,
                                     "gitshort: fast-forward") != 0)
            git::throw_error("git_reference_set_target");
        spdlog::info("fast-forwarded {} to {}", inner.branch, theirs_hex);
        return;
    }

    git::CommitGuard ours;
    if (git_commit_lookup(&ours.c, repo, git_reference_target(local.r)) != 0)
        git::throw_error("git_commit_lookup (ours)");

    git::IndexGuard merged;
    git_merge_options merge_opts = GIT_MERGE_OPTIONS_INIT;
    if (git_merge_commits(&merged.i, repo, ours.c, theirs.c, &merge_opts) != 0)
        git::throw_error("git_merge_commits");
    if (git_index_has_conflicts(merged.i)) {
        throw SyncError("merging " + remote_name + " into " + inner.branch +
                        " produced conflicts");
    }

    git_oid tree_oid;
    if (git_index_write_tree_to(&tree_oid, merged.i, repo) != 0)
        git::throw_error("git_index_write_tree_to");
    git::TreeGuard tree;
    if (git_tree_lookup(&tree.t, repo, &tree_oid) != 0)
        git::throw_error("git_tree_lookup (merge)");

    checkout_if_head(inner, reinterpret_cast<git_object*>(tree.t));

    git::SigGuard sig{git::make_signature(repo, inner.signature)};
    std::string msg = "Merge " + inner.remote + "/" + inner.branch +
                      " into " + inner.branch;
    const git_commit* parents[] = {ours.c, theirs.c};
    git_oid merge_oid;
    if (git_commit_create(&merge_oid, repo, local_name.c_str(), sig.s, sig.s,
                          "UTF-8", msg.c_str(), tree.t, 2, parents) != 0)
        git::throw_error("git_commit_create (merge)");
    spdlog::info("merged {} into {} as {}", remote_name, inner.branch,
                 git::oid_hex(&merge_oid));
}

} // anonymous namespace

SyncResult run(RecordStoreInner& inner) {
    if (git::ref_target(inner.repo, inner.branch_ref()).empty()) {
        throw SyncError("branch '" + inner.branch + "' has no commits to push");
    }

    SyncResult result;
    auto first = push_branch(inner);
    if (!first.ok) {
        if (!first.non_fast_forward) {
            throw SyncError("push to '" + inner.remote + "' failed: " + first.error);
        }
        spdlog::warn("push of {} to {} rejected ({}); fetching and merging",
                     inner.branch, inner.remote, first.error);
        fetch_branch(inner);
        merge_tracking(inner);
        result.merged = true;

        auto retry = push_branch(inner);
        if (!retry.ok) {
            throw SyncError("push to '" + inner.remote +
                            "' failed after merge: " + retry.error);
        }
    }

    result.tip = git::ref_target(inner.repo, inner.branch_ref());
    spdlog::info("pushed {} to {} at {}", inner.branch, inner.remote, result.tip);
    return result;
}

} // namespace sync
} // namespace gitshort
