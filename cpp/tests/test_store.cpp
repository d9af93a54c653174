#include <catch2/catch_test_macros.hpp>
#include "helpers.h"

#include <ctime>
#include <string>

using namespace gitshort;
using testing::TempDir;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void stage_file(RecordStore& store, const std::string& name) {
    testing::write_file(store.path() / name, "staged\n");
    git_index* index = nullptr;
    REQUIRE(git_repository_index(&index, store.inner()->repo) == 0);
    REQUIRE(git_index_add_bypath(index, name.c_str()) == 0);
    REQUIRE(git_index_write(index) == 0);
    git_index_free(index);
}

static void add_conflict(RecordStore& store, const std::string& name) {
    git_repository* repo = store.inner()->repo;
    git_oid blob;
    REQUIRE(git_blob_create_from_buffer(&blob, repo, "x\n", 2) == 0);

    git_index_entry ancestor{}, ours{}, theirs{};
    for (auto* e : {&ancestor, &ours, &theirs}) {
        e->path = name.c_str();
        e->mode = GIT_FILEMODE_BLOB;
        e->id = blob;
    }

    git_index* index = nullptr;
    REQUIRE(git_repository_index(&index, repo) == 0);
    REQUIRE(git_index_conflict_add(index, &ancestor, &ours, &theirs) == 0);
    REQUIRE(git_index_write(index) == 0);
    git_index_free(index);
}

static void start_merge(RecordStore& store) {
    fs::path gitdir = git_repository_path(store.inner()->repo);
    testing::write_file(gitdir / "MERGE_HEAD", *store.tip() + "\n");
}

// ---------------------------------------------------------------------------
// RecordStore::open
// ---------------------------------------------------------------------------

TEST_CASE("RecordStore: open throws NotFoundError when missing and create=false", "[store]") {
    TempDir dir;
    REQUIRE_FALSE(fs::exists(dir.path));
    CHECK_THROWS_AS(RecordStore::open(testing::store_options(dir.path)), NotFoundError);
}

TEST_CASE("RecordStore: open with create initialises the branch", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path, "links");
    CHECK(fs::exists(dir.path / ".git"));
    CHECK(store.branch() == "links");
    REQUIRE(store.tip().has_value());
    CHECK(store.tip()->size() == FULL_HASH_HEX);

    // The initial commit is not a record.
    auto walker = store.all();
    CHECK_FALSE(walker.next().has_value());
}

TEST_CASE("RecordStore: reopening keeps existing history", "[store]") {
    TempDir dir;
    std::string id;
    {
        auto store = testing::make_store(dir.path);
        id = store.create(testing::fields("https://example.com/")).id;
    }
    auto store = RecordStore::open(testing::store_options(dir.path));
    CHECK(store.get(id).url == "https://example.com/");
}

TEST_CASE("RecordStore: open from a subdirectory finds the working tree", "[store]") {
    TempDir dir;
    auto created = testing::make_store(dir.path);
    fs::create_directories(dir.path / "sub" / "dir");

    auto store = RecordStore::open(testing::store_options(dir.path / "sub" / "dir"));
    CHECK(fs::equivalent(store.path(), dir.path));
}

TEST_CASE("RecordStore: bare repositories are rejected", "[store]") {
    TempDir dir;
    git_repository* bare = nullptr;
    REQUIRE(git_repository_init(&bare, dir.path.string().c_str(), 1) == 0);
    git_repository_free(bare);

    CHECK_THROWS_AS(RecordStore::open(testing::store_options(dir.path)),
                    RepositoryStateError);
}

// ---------------------------------------------------------------------------
// create / get
// ---------------------------------------------------------------------------

TEST_CASE("RecordStore: create and get round trip", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);

    RecordFields f;
    f.url = "https://example.com/article?id=42";
    f.description = "An article\nwith two lines";
    f.extra["campaign"] = "launch";

    auto created = store.create(f);
    CHECK(created.url == f.url);
    CHECK(created.description == f.description);
    CHECK(created.extra == f.extra);
    CHECK(created.creator == "Test Author");
    CHECK(created.creator_email == "test@example.com");
    CHECK(created.commit_hash == *store.tip());
    CHECK(created.id == canonical_id(created.commit_hash));

    auto by_id = store.get(created.id);
    CHECK(by_id.commit_hash == created.commit_hash);
    CHECK(by_id.url == f.url);
    CHECK(by_id.description == f.description);
    CHECK(by_id.extra == f.extra);

    auto by_short = store.get(created.short_id);
    CHECK(by_short.commit_hash == created.commit_hash);
    CHECK(by_short.id == created.id);
}

TEST_CASE("RecordStore: record commits keep the parent tree", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = *store.tip();
    auto r = store.create(testing::fields("https://example.com/"));

    git_repository* repo = store.inner()->repo;
    git_oid oid;
    git_oid_fromstr(&oid, r.commit_hash.c_str());
    git_commit* commit = nullptr;
    REQUIRE(git_commit_lookup(&commit, repo, &oid) == 0);
    REQUIRE(git_commit_parentcount(commit) == 1);

    char parent_hex[GIT_OID_HEXSZ + 1];
    git_oid_tostr(parent_hex, sizeof(parent_hex), git_commit_parent_id(commit, 0));
    CHECK(std::string(parent_hex) == before);

    git_commit* parent = nullptr;
    REQUIRE(git_commit_parent(&parent, commit, 0) == 0);
    CHECK(git_oid_equal(git_commit_tree_id(commit), git_commit_tree_id(parent)));
    git_commit_free(parent);
    git_commit_free(commit);
}

TEST_CASE("RecordStore: created time is the author time in its own zone", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto now = static_cast<int64_t>(std::time(nullptr));
    auto r = store.create(testing::fields("https://example.com/"));

    int64_t utc = r.created - static_cast<int64_t>(r.created_offset) * 60;
    CHECK(utc >= now - 5);
    CHECK(utc <= now + 60);
}

TEST_CASE("RecordStore: identity falls back to repository configuration", "[store]") {
    TempDir dir;
    {
        auto store = testing::make_store(dir.path);
        git_config* cfg = nullptr;
        REQUIRE(git_repository_config(&cfg, store.inner()->repo) == 0);
        REQUIRE(git_config_set_string(cfg, "user.name", "Configured User") == 0);
        REQUIRE(git_config_set_string(cfg, "user.email", "configured@example.com") == 0);
        git_config_free(cfg);
    }

    auto opts = testing::store_options(dir.path);
    opts.author.reset();
    opts.email.reset();
    auto store = RecordStore::open(opts);
    auto r = store.create(testing::fields("https://example.com/"));
    CHECK(r.creator == "Configured User");
    CHECK(r.creator_email == "configured@example.com");
}

TEST_CASE("RecordStore: create switches to the tracked branch", "[store]") {
    TempDir dir;
    {
        auto master = testing::make_store(dir.path);
        git_repository* repo = master.inner()->repo;
        git_oid tip;
        REQUIRE(git_reference_name_to_id(&tip, repo, "refs/heads/master") == 0);
        git_commit* commit = nullptr;
        REQUIRE(git_commit_lookup(&commit, repo, &tip) == 0);
        git_reference* branch = nullptr;
        REQUIRE(git_branch_create(&branch, repo, "links", commit, 0) == 0);
        git_reference_free(branch);
        git_commit_free(commit);
    }

    auto store = RecordStore::open(testing::store_options(dir.path, "links"));
    auto r = store.create(testing::fields("https://example.com/"));

    git_reference* head = nullptr;
    REQUIRE(git_reference_lookup(&head, store.inner()->repo, "HEAD") == 0);
    CHECK(std::string(git_reference_symbolic_target(head)) == "refs/heads/links");
    git_reference_free(head);
    CHECK(*store.tip() == r.commit_hash);
}

// ---------------------------------------------------------------------------
// create: rejected writes leave the branch untouched
// ---------------------------------------------------------------------------

TEST_CASE("RecordStore: invalid URLs are rejected", "[store][validation]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = store.tip();

    CHECK_THROWS_AS(store.create(testing::fields("javascript:alert(1)")), ValidationError);
    CHECK_THROWS_AS(store.create(testing::fields("example.com")), ValidationError);
    CHECK_THROWS_AS(store.create(testing::fields("")), ValidationError);
    CHECK(store.tip() == before);
}

TEST_CASE("RecordStore: url extension field is rejected", "[store][validation]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = store.tip();

    auto f = testing::fields("https://example.com/");
    f.extra["url"] = "https://elsewhere.example.com/";
    CHECK_THROWS_AS(store.create(f), ValidationError);
    CHECK(store.tip() == before);
}

TEST_CASE("RecordStore: staged changes block create", "[store][state]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = store.tip();

    stage_file(store, "notes.txt");
    CHECK_THROWS_AS(store.create(testing::fields("https://example.com/")),
                    RepositoryStateError);
    CHECK(store.tip() == before);
}

TEST_CASE("RecordStore: untracked files do not block create", "[store][state]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    testing::write_file(dir.path / "scratch.txt", "not staged\n");
    CHECK_NOTHROW(store.create(testing::fields("https://example.com/")));
}

TEST_CASE("RecordStore: index conflicts block create", "[store][state]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = store.tip();

    add_conflict(store, "conflicted.txt");
    CHECK_THROWS_AS(store.create(testing::fields("https://example.com/")),
                    RepositoryStateError);
    CHECK(store.tip() == before);
}

TEST_CASE("RecordStore: merge in progress blocks create", "[store][state]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto before = store.tip();

    start_merge(store);
    CHECK_THROWS_AS(store.create(testing::fields("https://example.com/")),
                    RepositoryStateError);
    CHECK(store.tip() == before);
}

TEST_CASE("RecordStore: unborn branch blocks create", "[store][state]") {
    TempDir dir;
    git_repository* repo = nullptr;
    REQUIRE(git_repository_init(&repo, dir.path.string().c_str(), 0) == 0);
    REQUIRE(git_repository_set_head(repo, "refs/heads/master") == 0);
    git_repository_free(repo);

    auto store = RecordStore::open(testing::store_options(dir.path));
    CHECK_FALSE(store.tip().has_value());
    CHECK_THROWS_AS(store.create(testing::fields("https://example.com/")),
                    RepositoryStateError);
    CHECK_FALSE(store.tip().has_value());
}

TEST_CASE("RecordStore: missing tracked branch blocks create", "[store][state]") {
    TempDir dir;
    testing::make_store(dir.path);

    auto store = RecordStore::open(testing::store_options(dir.path, "nonexistent"));
    CHECK_THROWS_AS(store.create(testing::fields("https://example.com/")),
                    RepositoryStateError);
}

// ---------------------------------------------------------------------------
// get: lookups that find nothing
// ---------------------------------------------------------------------------

TEST_CASE("RecordStore: get of unknown ids throws NotFoundError", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    store.create(testing::fields("https://example.com/"));

    CHECK_THROWS_AS(store.get(""), NotFoundError);
    CHECK_THROWS_AS(store.get("0OIl"), NotFoundError);
    CHECK_THROWS_AS(store.get(canonical_id(std::string(40, 'f'))), NotFoundError);
}

TEST_CASE("RecordStore: get of a commit that is not a record throws NotFoundError", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto init_id = canonical_id(*store.tip());
    CHECK_THROWS_AS(store.get(init_id), NotFoundError);

    auto chore = testing::commit_raw(store, "Update tooling");
    CHECK_THROWS_AS(store.get(canonical_id(chore)), NotFoundError);
}

TEST_CASE("RecordStore: resolve maps ids to commit hashes", "[store]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto r = store.create(testing::fields("https://example.com/"));

    CHECK(store.resolve(r.id) == r.commit_hash);
    CHECK(store.resolve(r.short_id) == r.commit_hash);
    CHECK_FALSE(store.resolve("0OIl").has_value());
    CHECK(store.canonical_id(r.commit_hash) == r.id);
}
