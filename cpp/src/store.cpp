#include "gitshort/store.h"
#include "gitshort/ids.h"
#include "gitshort/record.h"
#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace gitshort {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

std::optional<Signature> explicit_signature(const StoreOptions& opts) {
    if (!opts.author && !opts.email) return std::nullopt;
    Signature sig;
    if (opts.author) sig.name  = *opts.author;
    if (opts.email)  sig.email = *opts.email;
    return sig;
}

const char* state_name(int state) {
    switch (state) {
        case GIT_REPOSITORY_STATE_MERGE:
            return "merge";
        case GIT_REPOSITORY_STATE_REVERT:
        case GIT_REPOSITORY_STATE_REVERT_SEQUENCE:
            return "revert";
        case GIT_REPOSITORY_STATE_CHERRYPICK:
        case GIT_REPOSITORY_STATE_CHERRYPICK_SEQUENCE:
            return "cherry-pick";
        case GIT_REPOSITORY_STATE_BISECT:
            return "bisect";
        case GIT_REPOSITORY_STATE_REBASE:
        case GIT_REPOSITORY_STATE_REBASE_INTERACTIVE:
        case GIT_REPOSITORY_STATE_REBASE_MERGE:
            return "rebase";
        case GIT_REPOSITORY_STATE_APPLY_MAILBOX:
        case GIT_REPOSITORY_STATE_APPLY_MAILBOX_OR_REBASE:
            return "am";
        default:
            return "repository operation";
    }
}

std::filesystem::path workdir_of(git_repository* repo) {
    std::string wd = git_repository_workdir(repo);
    while (wd.size() > 1 && wd.back() == '/') wd.pop_back();
    return wd;
}

/// Write an initial commit with an empty tree on `branch` and point HEAD
/// at it.
void init_branch(git_repository* repo,
                 const std::string& branch,
                 const std::optional<Signature>& sig) {
    git_treebuilder* tb = nullptr;
    if (git_treebuilder_new(&tb, repo, nullptr) != 0)
        git::throw_error("git_treebuilder_new");
    git_oid tree_oid;
    if (git_treebuilder_write(&tree_oid, tb) != 0) {
        git_treebuilder_free(tb);
        git::throw_error("git_treebuilder_write");
    }
    git_treebuilder_free(tb);

    git::TreeGuard tree;
    if (git_tree_lookup(&tree.t, repo, &tree_oid) != 0)
        git::throw_error("git_tree_lookup");

    git::SigGuard author{git::make_signature(repo, sig)};

    std::string msg = "Initialize " + branch;
    std::string refname = "refs/heads/" + branch;

    git_oid commit_oid;
    if (git_commit_create(&commit_oid, repo, refname.c_str(),
                          author.s, author.s, "UTF-8",
                          msg.c_str(), tree.t, 0, nullptr) != 0)
        git::throw_error("git_commit_create");

    if (git_repository_set_head(repo, refname.c_str()) != 0)
        git::throw_error("git_repository_set_head");
}

/// Make HEAD point at `refname`, checking it out if needed. An unborn
/// branch that HEAD already names counts as checked out.
void checkout_branch(git_repository* repo,
                     const std::string& refname,
                     const std::string& branch) {
    git::RefGuard head;
    if (git_reference_lookup(&head.r, repo, "HEAD") != 0)
        git::throw_error("git_reference_lookup (HEAD)");
    if (git_reference_type(head.r) == GIT_REFERENCE_SYMBOLIC &&
        refname == git_reference_symbolic_target(head.r)) {
        return;
    }

    std::string target = git::ref_target(repo, refname);
    if (target.empty()) {
        throw RepositoryStateError("branch '" + branch + "' does not exist");
    }

    git_oid oid = git::hex_to_oid(target);
    git::ObjectGuard commit;
    if (git_object_lookup(&commit.o, repo, &oid, GIT_OBJECT_COMMIT) != 0)
        git::throw_error("git_object_lookup");

    git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
    co.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(repo, commit.o, &co) != 0) {
        throw RepositoryStateError("cannot check out '" + branch + "': " +
                                   git::last_error());
    }
    if (git_repository_set_head(repo, refname.c_str()) != 0)
        git::throw_error("git_repository_set_head");
    spdlog::info("checked out branch {}", branch);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// records
// ---------------------------------------------------------------------------

namespace records {

Record from_commit(RecordStoreInner& inner, const git_commit* commit) {
    const char* msg = git_commit_message(commit);
    auto decoded = decode_message(msg ? msg : "");

    Record r;
    r.commit_hash = git::oid_hex(git_commit_id(commit));
    r.id          = canonical_id(r.commit_hash);
    r.short_id    = short_id(inner.resolver, r.commit_hash);
    r.url         = std::move(decoded.url);
    r.description = std::move(decoded.description);
    r.extra       = std::move(decoded.extra);

    const git_signature* author = git_commit_author(commit);
    if (author) {
        r.created_offset = author->when.offset;
        r.created = static_cast<int64_t>(author->when.time) +
                    static_cast<int64_t>(author->when.offset) * 60;
        r.creator       = author->name  ? author->name  : "";
        r.creator_email = author->email ? author->email : "";
    }
    return r;
}

Record read(RecordStoreInner& inner, const std::string& commit_hex) {
    git_oid oid = git::hex_to_oid(commit_hex);
    git::CommitGuard cg;
    if (git_commit_lookup(&cg.c, inner.repo, &oid) != 0)
        git::throw_error("git_commit_lookup (" + commit_hex + ")");
    return from_commit(inner, cg.c);
}

} // namespace records

// ---------------------------------------------------------------------------
// RecordStoreInner
// ---------------------------------------------------------------------------

RecordStoreInner::RecordStoreInner(git_repository* r,
                                   std::filesystem::path wd,
                                   const StoreOptions& opts)
    : repo(r), workdir(std::move(wd)), branch(opts.branch),
      remote(opts.remote), signature(explicit_signature(opts)),
      resolver(r, workdir, opts.disambiguator) {}

RecordStoreInner::~RecordStoreInner() {
    if (repo) git_repository_free(repo);
}

// ---------------------------------------------------------------------------
// RecordStore::open
// ---------------------------------------------------------------------------

RecordStore RecordStore::open(const StoreOptions& opts) {
    if (opts.branch.empty()) throw ValidationError("branch name is empty");

    git_repository* repo = nullptr;
    int rc = git_repository_open_ext(&repo, opts.path.string().c_str(), 0, nullptr);

    if (rc == GIT_ENOTFOUND) {
        if (!opts.create) {
            throw NotFoundError("repository not found: " + opts.path.string());
        }
        std::filesystem::create_directories(opts.path);
        if (git_repository_init(&repo, opts.path.string().c_str(), 0 /*bare*/) != 0)
            git::throw_error("git_repository_init");
        spdlog::info("initialised repository at {}", opts.path.string());
    } else if (rc != 0) {
        git::throw_error("git_repository_open_ext");
    }

    if (git_repository_is_bare(repo)) {
        git_repository_free(repo);
        throw RepositoryStateError("repository at " + opts.path.string() +
                                   " is bare; a working tree is required");
    }

    if (opts.create && git_repository_is_empty(repo) == 1) {
        try {
            init_branch(repo, opts.branch, explicit_signature(opts));
        } catch (...) {
            git_repository_free(repo);
            throw;
        }
    }

    auto wd = workdir_of(repo);
    auto inner = std::make_shared<RecordStoreInner>(repo, wd, opts);
    spdlog::debug("opened {} tracking {}", wd.string(), opts.branch);
    return RecordStore(std::move(inner));
}

RecordStore::RecordStore(std::shared_ptr<RecordStoreInner> inner)
    : inner_(std::move(inner)) {}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

Record RecordStore::get(const std::string& id) {
    std::string prefix;
    try {
        prefix = decode_id(id);
    } catch (const InvalidIdError&) {
        throw NotFoundError(id);
    }

    std::lock_guard<std::mutex> lk(inner_->mutex);
    auto hash = inner_->resolver.resolve(prefix);
    if (!hash) throw NotFoundError(id);

    try {
        return records::read(*inner_, *hash);
    } catch (const DecodeError& e) {
        spdlog::warn("{} names commit {} which is not a record ({})",
                     id, *hash, e.what());
        throw NotFoundError(id);
    }
}

RecordWalker RecordStore::all(const Range& range) {
    return RecordWalker(inner_, range);
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

Record RecordStore::create(const RecordFields& fields) {
    if (!is_valid_url(fields.url)) {
        throw ValidationError("'" + fields.url +
                              "' is not a valid http, https or ftp URL");
    }
    std::string message = encode_message(fields);

    std::lock_guard<std::mutex> lk(inner_->mutex);
    git_repository* repo = inner_->repo;
    std::string refname = inner_->branch_ref();

    checkout_branch(repo, refname, inner_->branch);

    git::IndexGuard index;
    if (git_repository_index(&index.i, repo) != 0)
        git::throw_error("git_repository_index");
    if (git_index_read(index.i, 0) != 0)
        git::throw_error("git_index_read");
    if (git_index_has_conflicts(index.i)) {
        throw RepositoryStateError("index has unresolved merge conflicts");
    }

    std::string tip = git::ref_target(repo, refname);
    git::CommitGuard parent;
    git::TreeGuard tree;
    if (!tip.empty()) {
        git_oid tip_oid = git::hex_to_oid(tip);
        if (git_commit_lookup(&parent.c, repo, &tip_oid) != 0)
            git::throw_error("git_commit_lookup (tip)");
        if (git_commit_tree(&tree.t, parent.c) != 0)
            git::throw_error("git_commit_tree");
    }

    // The new commit reuses the tip's tree, so nothing may be staged.
    git_diff* diff = nullptr;
    if (git_diff_tree_to_index(&diff, repo, tree.t, index.i, nullptr) != 0)
        git::throw_error("git_diff_tree_to_index");
    size_t staged = git_diff_num_deltas(diff);
    git_diff_free(diff);
    if (staged > 0) {
        throw RepositoryStateError(std::to_string(staged) +
                                   " staged change(s) in the index");
    }

    if (tip.empty()) {
        throw RepositoryStateError("branch '" + inner_->branch +
                                   "' has no commits");
    }

    int state = git_repository_state(repo);
    if (state != GIT_REPOSITORY_STATE_NONE) {
        throw RepositoryStateError(std::string("a ") + state_name(state) +
                                   " is in progress");
    }

    git::SigGuard sig{git::make_signature(repo, inner_->signature)};
    const git_commit* parents[] = {parent.c};
    git_oid new_oid;
    if (git_commit_create(&new_oid, repo, refname.c_str(),
                          sig.s, sig.s, "UTF-8", message.c_str(),
                          tree.t, 1, parents) != 0)
        git::throw_error("git_commit_create");

    std::string hash = git::oid_hex(&new_oid);
    spdlog::info("created record {} for {}", hash, fields.url);
    return records::read(*inner_, hash);
}

SyncResult RecordStore::sync() {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return sync::run(*inner_);
}

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

std::string RecordStore::canonical_id(const std::string& commit_hex) const {
    return gitshort::canonical_id(commit_hex);
}

std::string RecordStore::short_id(const std::string& commit_hex) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return gitshort::short_id(inner_->resolver, commit_hex);
}

std::optional<std::string> RecordStore::resolve(const std::string& id) {
    std::string prefix;
    try {
        prefix = decode_id(id);
    } catch (const InvalidIdError&) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return inner_->resolver.resolve(prefix);
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

const std::filesystem::path& RecordStore::path() const {
    return inner_->workdir;
}

const std::string& RecordStore::branch() const {
    return inner_->branch;
}

std::optional<std::string> RecordStore::tip() {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    std::string hex = git::ref_target(inner_->repo, inner_->branch_ref());
    if (hex.empty()) return std::nullopt;
    return hex;
}

} // namespace gitshort
