//
// Created by garrett on 3/4/25.
//
#include <gtest/gtest.h>
#include "fingerprint_cache.hpp"
#include "temp_tree.hpp"

#include <json/json.h>

class FingerprintCacheTest : public TempTreeTest {
protected:
    fs::path cachePath;

    void SetUp() override {
        TempTreeTest::SetUp();
        cachePath = testDir / "cache.json";
    }

    static FileRecord makeRecord(const std::string& path, uint64_t size, double mtime, const std::string& hash) {
        FileRecord record;
        record.path = path;
        record.size = size;
        record.modifiedTime = mtime;
        record.contentHash = hash;
        return record;
    }
};

TEST_F(FingerprintCacheTest, MissingFileLoadsEmpty) {
    FingerprintCache cache(cachePath.string());

    EXPECT_EQ(cache.load(), 0u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(FingerprintCacheTest, CorruptFileLoadsEmpty) {
    writeFile(cachePath, "{ this is not json");
    FingerprintCache cache(cachePath.string());

    EXPECT_EQ(cache.load(), 0u);
}

TEST_F(FingerprintCacheTest, NonObjectRootLoadsEmpty) {
    writeFile(cachePath, "[1, 2, 3]");
    FingerprintCache cache(cachePath.string());

    EXPECT_EQ(cache.load(), 0u);
}

TEST_F(FingerprintCacheTest, MalformedEntriesAreSkipped) {
    writeFile(cachePath, R"({
        "/data/good.txt": { "size": 5, "mtime": 1700000000.5, "hash": "abc" },
        "/data/no_hash.txt": { "size": 5, "mtime": 1700000000.5 },
        "/data/bad_size.txt": { "size": "five", "mtime": 1.0, "hash": "abc" },
        "/data/not_object.txt": 42
    })");
    FingerprintCache cache(cachePath.string());

    EXPECT_EQ(cache.load(), 1u);
    auto entry = cache.entry("/data/good.txt");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->size, 5u);
    EXPECT_DOUBLE_EQ(entry->modifiedTime, 1700000000.5);
    EXPECT_EQ(entry->contentHash, "abc");
}

TEST_F(FingerprintCacheTest, PersistAndReload) {
    {
        FingerprintCache cache(cachePath.string());
        cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 1700000000.25, "aaa"));
        cache.update("/data/b.txt", makeRecord("/data/b.txt", 7, 1700000100.75, "bbb"));
        EXPECT_TRUE(cache.persist());
    }

    EXPECT_TRUE(fs::exists(cachePath));
    EXPECT_FALSE(fs::exists(cachePath.string() + ".tmp"));

    FingerprintCache reloaded(cachePath.string());
    EXPECT_EQ(reloaded.load(), 2u);

    auto a = reloaded.entry("/data/a.txt");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->size, 5u);
    EXPECT_DOUBLE_EQ(a->modifiedTime, 1700000000.25);
    EXPECT_EQ(a->contentHash, "aaa");
}

TEST_F(FingerprintCacheTest, PersistedFormatIsKeyedJson) {
    FingerprintCache cache(cachePath.string());
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 1700000000.5, "aaa"));
    ASSERT_TRUE(cache.persist());

    std::ifstream in(cachePath);
    Json::Value root;
    Json::CharReaderBuilder builder;
    JSONCPP_STRING errs;
    ASSERT_TRUE(Json::parseFromStream(builder, in, &root, &errs)) << errs;

    ASSERT_TRUE(root.isMember("/data/a.txt"));
    EXPECT_EQ(root["/data/a.txt"]["size"].asUInt64(), 5u);
    EXPECT_DOUBLE_EQ(root["/data/a.txt"]["mtime"].asDouble(), 1700000000.5);
    EXPECT_EQ(root["/data/a.txt"]["hash"].asString(), "aaa");
}

TEST_F(FingerprintCacheTest, NonUtf8KeySurvivesReload) {
    const std::string key = "/data/caf\xe9.txt";
    const std::string neighbour = "/data/caf\xe8.txt";
    {
        FingerprintCache cache(cachePath.string());
        cache.update(key, makeRecord(key, 5, 100.0, "aaa"));
        cache.update(neighbour, makeRecord(neighbour, 6, 100.0, "bbb"));
        ASSERT_TRUE(cache.persist());
    }

    // Raw bytes are written as-is, not re-encoded
    EXPECT_NE(readFile(cachePath).find(key), std::string::npos);

    FingerprintCache reloaded(cachePath.string());
    EXPECT_EQ(reloaded.load(), 2u);
    auto entry = reloaded.entry(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->contentHash, "aaa");
    EXPECT_EQ(reloaded.entry(neighbour)->contentHash, "bbb");
}

TEST_F(FingerprintCacheTest, UpdateOverwrites) {
    FingerprintCache cache(cachePath.string());
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 100.0, "old"));
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 6, 200.0, "new"));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.entry("/data/a.txt")->contentHash, "new");
}

TEST_F(FingerprintCacheTest, LookupRequiresMatchingSize) {
    FingerprintCache cache(cachePath.string());
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 100.0, "aaa"));

    EXPECT_TRUE(cache.lookupValid("/data/a.txt", 5, 100.0).has_value());
    EXPECT_FALSE(cache.lookupValid("/data/a.txt", 6, 100.0).has_value());
    EXPECT_FALSE(cache.lookupValid("/data/other.txt", 5, 100.0).has_value());
}

TEST_F(FingerprintCacheTest, LookupToleratesOneSecondOfMtimeDrift) {
    FingerprintCache cache(cachePath.string());
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 100.0, "aaa"));

    EXPECT_TRUE(cache.lookupValid("/data/a.txt", 5, 101.0).has_value());
    EXPECT_TRUE(cache.lookupValid("/data/a.txt", 5, 99.5).has_value());
    EXPECT_FALSE(cache.lookupValid("/data/a.txt", 5, 101.5).has_value());
    EXPECT_FALSE(cache.lookupValid("/data/a.txt", 5, 98.0).has_value());
}

TEST_F(FingerprintCacheTest, PersistFailureIsReportedNotThrown) {
    FingerprintCache cache((testDir / "missing_dir" / "cache.json").string());
    cache.update("/data/a.txt", makeRecord("/data/a.txt", 5, 100.0, "aaa"));

    bool saved = true;
    EXPECT_NO_THROW(saved = cache.persist());
    EXPECT_FALSE(saved);
}

TEST_F(FingerprintCacheTest, ResolveKeyIsCanonical) {
    auto file = writeFile(testDir / "sub" / "a.txt", "hello");
    fs::path indirect = testDir / "sub" / ".." / "sub" / "a.txt";

    EXPECT_EQ(FingerprintCache::resolveKey(indirect), fs::canonical(file).string());
}

TEST_F(FingerprintCacheTest, ResolveKeyFollowsSymlinks) {
    auto file = writeFile(testDir / "real" / "a.txt", "hello");
    fs::create_directory_symlink(testDir / "real", testDir / "alias");

    EXPECT_EQ(FingerprintCache::resolveKey(testDir / "alias" / "a.txt"), fs::canonical(file).string());
}

TEST_F(FingerprintCacheTest, ResolveKeyOfMissingFileIsAbsolute) {
    fs::path missing = testDir / "x" / ".." / "missing.txt";

    EXPECT_EQ(FingerprintCache::resolveKey(missing), (testDir / "missing.txt").lexically_normal().string());
}
