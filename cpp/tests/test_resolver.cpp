#include <catch2/catch_test_macros.hpp>
#include "helpers.h"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>

using namespace gitshort;
using testing::TempDir;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Append records until two commits share their first two bytes.
static std::pair<Record, Record> create_colliding(RecordStore& store) {
    std::map<std::string, Record> by_prefix;
    for (int i = 0; i < 20000; ++i) {
        auto r = store.create(testing::fields(
            "https://example.com/" + std::to_string(i)));
        auto prefix = r.commit_hash.substr(0, MIN_PREFIX_HEX);
        auto it = by_prefix.find(prefix);
        if (it != by_prefix.end()) return {it->second, r};
        by_prefix.emplace(prefix, r);
    }
    FAIL("no two-byte collision after 20000 records");
    return {};
}

static std::string prefix_id(const std::string& hex) {
    return base58_encode(hex_to_bytes(hex));
}

// ---------------------------------------------------------------------------
// is_disambiguable
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: only hex prefixes of two bytes or more are disambiguated", "[resolver]") {
    CHECK(CommitResolver::is_disambiguable("abcd"));
    CHECK(CommitResolver::is_disambiguable("ABCDEF12"));
    CHECK_FALSE(CommitResolver::is_disambiguable("abc"));
    CHECK_FALSE(CommitResolver::is_disambiguable(""));
    CHECK_FALSE(CommitResolver::is_disambiguable("abcz"));
    CHECK_FALSE(CommitResolver::is_disambiguable("ab;rm -rf /"));
}

// ---------------------------------------------------------------------------
// Direct lookups
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: full hash and unique prefix resolve", "[resolver]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto r = store.create(testing::fields("https://example.com/"));
    auto& resolver = store.inner()->resolver;

    CHECK(resolver.resolve(r.commit_hash) == r.commit_hash);
    CHECK(resolver.resolve(r.commit_hash.substr(0, 12)) == r.commit_hash);
    CHECK(resolver.resolves_uniquely(r.commit_hash.substr(0, 12), r.commit_hash));
}

TEST_CASE("Resolver: unknown or malformed prefixes resolve to nothing", "[resolver]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto r = store.create(testing::fields("https://example.com/"));
    auto& resolver = store.inner()->resolver;

    std::string other = r.commit_hash;
    other[0] = other[0] == 'f' ? 'e' : 'f';
    CHECK_FALSE(resolver.resolve(other).has_value());
    CHECK_FALSE(resolver.resolve("not-hex").has_value());
    CHECK_FALSE(resolver.resolve(r.commit_hash + "00").has_value());
    CHECK_FALSE(resolver.resolves_uniquely(other.substr(0, 12), r.commit_hash));
}

TEST_CASE("Resolver: a prefix naming a tree is not a commit", "[resolver]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    // Every commit in the store points at the empty tree.
    CHECK_FALSE(store.inner()->resolver
                    .resolve("4b825dc642cb6eb9a060e54bf8d69288fbee4904")
                    .has_value());
}

TEST_CASE("Resolver: unambiguous lookups never consult the disambiguator", "[resolver]") {
    TempDir dir;
    auto opts = testing::store_options(dir.path);
    opts.create = true;
    auto counting = std::make_shared<testing::OdbDisambiguator>();
    opts.disambiguator = counting;
    auto store = RecordStore::open(opts);

    auto r = store.create(testing::fields("https://example.com/"));
    CHECK(store.resolve(r.id) == r.commit_hash);
    CHECK(store.resolve(r.short_id) == r.commit_hash);
    CHECK(counting->calls == 0);
}

// ---------------------------------------------------------------------------
// Ambiguous prefixes
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: colliding prefixes fall back to the disambiguator", "[resolver][collision]") {
    TempDir dir;
    auto opts = testing::store_options(dir.path);
    opts.create = true;
    auto counting = std::make_shared<testing::OdbDisambiguator>();
    opts.disambiguator = counting;
    auto store = RecordStore::open(opts);

    auto [a, b] = create_colliding(store);
    auto prefix = a.commit_hash.substr(0, MIN_PREFIX_HEX);
    REQUIRE(b.commit_hash.substr(0, MIN_PREFIX_HEX) == prefix);

    auto& resolver = store.inner()->resolver;
    counting->calls = 0;

    auto resolved = resolver.resolve(prefix);
    REQUIRE(resolved.has_value());
    CHECK((*resolved == a.commit_hash || *resolved == b.commit_hash));
    CHECK(counting->calls == 1);

    CHECK_FALSE(resolver.resolves_uniquely(prefix, a.commit_hash));
    CHECK_FALSE(resolver.resolves_uniquely(prefix, b.commit_hash));
}

TEST_CASE("Resolver: colliding records get longer short ids", "[resolver][collision]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto [a, b] = create_colliding(store);

    auto a_short = decode_id(store.short_id(a.commit_hash));
    auto b_short = decode_id(store.short_id(b.commit_hash));
    CHECK(a_short.size() >= MIN_PREFIX_HEX + 2);
    CHECK(b_short.size() >= MIN_PREFIX_HEX + 2);
    CHECK(a_short.size() % 2 == 0);
    CHECK(a.commit_hash.rfind(a_short, 0) == 0);
    CHECK(b.commit_hash.rfind(b_short, 0) == 0);

    CHECK(store.get(store.short_id(a.commit_hash)).commit_hash == a.commit_hash);
    CHECK(store.get(store.short_id(b.commit_hash)).commit_hash == b.commit_hash);

    // Short ids are computed on read; the one handed out when `a` was
    // created no longer names it alone.
    CHECK(store.short_id(a.commit_hash) != a.short_id);
}

TEST_CASE("Resolver: short ids start at two bytes", "[resolver]") {
    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto r = store.create(testing::fields("https://example.com/"));
    CHECK(decode_id(r.short_id) == r.commit_hash.substr(0, MIN_PREFIX_HEX));
    CHECK(r.short_id == prefix_id(r.commit_hash.substr(0, MIN_PREFIX_HEX)));
}

// ---------------------------------------------------------------------------
// GitProcessDisambiguator
// ---------------------------------------------------------------------------

TEST_CASE("GitProcessDisambiguator: lists objects sharing a prefix", "[resolver][git]") {
    if (std::system("git --version >/dev/null 2>&1") != 0) {
        SKIP("git executable not available");
    }

    TempDir dir;
    auto store = testing::make_store(dir.path);
    auto r = store.create(testing::fields("https://example.com/"));

    GitProcessDisambiguator git;
    auto found = git.candidates(store.path(), r.commit_hash.substr(0, 8));
    REQUIRE_FALSE(found.empty());
    CHECK(std::find(found.begin(), found.end(), r.commit_hash) != found.end());
}

TEST_CASE("GitProcessDisambiguator: refuses prefixes unsafe for the shell", "[resolver]") {
    GitProcessDisambiguator git;
    CHECK_THROWS_AS(git.candidates(".", "ab; echo"), ValidationError);
    CHECK_THROWS_AS(git.candidates(".", "ab"), ValidationError);
}
