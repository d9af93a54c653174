#include "gitshort/store.h"
#include "internal.h"

#include <git2.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace gitshort {

namespace {

/// RAII wrapper for git_revwalk*.
struct WalkGuard {
    git_revwalk* w = nullptr;
    ~WalkGuard() { if (w) git_revwalk_free(w); }
};

/// Resolve a revision expression to the commit it names.
/// @throws NotFoundError if it names nothing or nothing commit-like.
git_oid peel_to_commit(git_repository* repo, const std::string& spec) {
    git::ObjectGuard obj;
    if (git_revparse_single(&obj.o, repo, spec.c_str()) != 0)
        throw NotFoundError("revision '" + spec + "'");

    git::ObjectGuard commit;
    if (git_object_peel(&commit.o, obj.o, GIT_OBJECT_COMMIT) != 0)
        throw NotFoundError("revision '" + spec + "' is not a commit");
    return *git_object_id(commit.o);
}

} // anonymous namespace

RecordWalker::RecordWalker(std::shared_ptr<RecordStoreInner> inner,
                           const Range& range)
    : inner_(std::move(inner)) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    git_repository* repo = inner_->repo;

    git_oid until;
    if (range.until) {
        until = peel_to_commit(repo, *range.until);
    } else {
        std::string tip = git::ref_target(repo, inner_->branch_ref());
        if (tip.empty()) return; // unborn branch: nothing to walk
        until = git::hex_to_oid(tip);
    }

    WalkGuard wg;
    if (git_revwalk_new(&wg.w, repo) != 0)
        git::throw_error("git_revwalk_new");

    // Oldest first; topological order keeps parents ahead of children that
    // share a timestamp.
    if (git_revwalk_sorting(wg.w, GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME |
                                      GIT_SORT_REVERSE) != 0)
        git::throw_error("git_revwalk_sorting");

    if (git_revwalk_push(wg.w, &until) != 0)
        git::throw_error("git_revwalk_push");

    if (range.from) {
        // `from` itself is included: hide only its parents.
        git_oid from = peel_to_commit(repo, *range.from);
        git::CommitGuard cg;
        if (git_commit_lookup(&cg.c, repo, &from) != 0)
            git::throw_error("git_commit_lookup (from)");
        unsigned int n = git_commit_parentcount(cg.c);
        for (unsigned int i = 0; i < n; ++i) {
            if (git_revwalk_hide(wg.w, git_commit_parent_id(cg.c, i)) != 0)
                git::throw_error("git_revwalk_hide");
        }
    }

    walk_ = wg.w;
    wg.w = nullptr;
}

RecordWalker::~RecordWalker() {
    if (walk_) {
        std::lock_guard<std::mutex> lk(inner_->mutex);
        release();
    }
}

RecordWalker::RecordWalker(RecordWalker&& other) noexcept
    : inner_(std::move(other.inner_)), walk_(other.walk_) {
    other.walk_ = nullptr;
}

RecordWalker& RecordWalker::operator=(RecordWalker&& other) noexcept {
    if (this != &other) {
        if (walk_) {
            std::lock_guard<std::mutex> lk(inner_->mutex);
            release();
        }
        inner_ = std::move(other.inner_);
        walk_ = other.walk_;
        other.walk_ = nullptr;
    }
    return *this;
}

void RecordWalker::release() {
    git_revwalk_free(walk_);
    walk_ = nullptr;
}

std::optional<Record> RecordWalker::next() {
    if (!walk_) return std::nullopt;
    std::lock_guard<std::mutex> lk(inner_->mutex);

    git_oid oid;
    while (true) {
        int rc = git_revwalk_next(&oid, walk_);
        if (rc == GIT_ITEROVER) {
            release();
            return std::nullopt;
        }
        if (rc != 0) git::throw_error("git_revwalk_next");

        git::CommitGuard cg;
        if (git_commit_lookup(&cg.c, inner_->repo, &oid) != 0)
            git::throw_error("git_commit_lookup");

        try {
            return records::from_commit(*inner_, cg.c);
        } catch (const DecodeError& e) {
            spdlog::debug("skipping commit {}: {}", git::oid_hex(&oid), e.what());
        }
    }
}

} // namespace gitshort
