//src/test/db_compare.test.cpp
#include "test_helpers.h"

using namespace nestkv;
using nestkv::test::DatabaseTestBase;
using nestkv::test::TEST_MAP_SIZE;
using nestkv::test::expectStorageError;
using nestkv::test::openOrFail;
using nestkv::test::uniqueTestDir;
using storage::Status;

class DbCompareTest : public DatabaseTestBase {
protected:
    std::string other_dir;
    std::unique_ptr<Database> other;

    std::vector<std::string> bucketNames() const override { return {"B", "C"}; }

    void SetUp() override {
        DatabaseTestBase::SetUp();
        other_dir = uniqueTestDir("compare_other");
        other = openOrFail(other_dir, bucketNames());
        ASSERT_NE(other, nullptr);
    }

    void TearDown() override {
        other.reset();
        removeDir(other_dir);
        DatabaseTestBase::TearDown();
    }

    void fill(Database& target, const std::vector<std::pair<std::string, std::string>>& cells) {
        Status s = target.runWrite([&](ReadWriteTransaction& txn) -> Status {
            for (const auto& [key, value] : cells) {
                txn.put("B", key, value);
            }
            return storage::OkStatus();
        });
        ASSERT_TRUE(s.isOk());
    }
};

TEST_F(DbCompareTest, EmptyDatabasesAreEqual) {
    EXPECT_TRUE(isEqualDb(*db, *other));
    EXPECT_TRUE(makePatchOfDb(*db).empty());
}

TEST_F(DbCompareTest, InsertionOrderDoesNotMatter) {
    fill(*db, {{"a", "1"}, {"b", "2"}, {"c", "3"}});
    fill(*other, {{"c", "3"}, {"a", "1"}});
    fill(*other, {{"b", "2"}});
    EXPECT_TRUE(isEqualDb(*db, *other));
}

TEST_F(DbCompareTest, DifferentValueOrKeyOrBucket) {
    fill(*db, {{"a", "1"}});
    fill(*other, {{"a", "2"}});
    EXPECT_FALSE(isEqualDb(*db, *other));

    fill(*other, {{"a", "1"}, {"extra", "x"}});
    EXPECT_FALSE(isEqualDb(*db, *other));

    Status s = other->runWrite([](ReadWriteTransaction& txn) -> Status {
        txn.del("B", "extra");
        txn.put("C", "a", "1");
        return storage::OkStatus();
    });
    ASSERT_TRUE(s.isOk());
    // Same key and value, but in another bucket.
    EXPECT_FALSE(isEqualDb(*db, *other));
}

TEST_F(DbCompareTest, PatchOfDbListsEveryCell) {
    putCommitted("C", "x", "9");
    fill(*db, {{"b", "2"}, {"a", "1"}});
    TxnPatch patch = makePatchOfDb(*db);
    ASSERT_EQ(patch.size(), 3u);
    EXPECT_EQ(patch[0].bucket, "B");
    EXPECT_EQ(patch[0].key, "a");
    EXPECT_EQ(patch[1].key, "b");
    EXPECT_EQ(patch[2].bucket, "C");
    for (const auto& cell : patch) {
        EXPECT_TRUE(cell.exists);
    }
}

TEST_F(DbCompareTest, BucketsLeftOutByTheLimitFailTheComparison) {
    std::string dir = uniqueTestDir("compare_limit");
    {
        auto full = openOrFail(dir, {"b1", "b2", "b3", "b4"});
        ASSERT_NE(full, nullptr);
        Status s = full->runWrite([](ReadWriteTransaction& txn) -> Status {
            txn.put("b4", "only", "here");
            return storage::OkStatus();
        });
        ASSERT_TRUE(s.isOk());
    }
    auto result = Database::open2(dir, {}, TEST_MAP_SIZE, 2);
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    auto limited = std::move(result).value();
    EXPECT_EQ(limited->buckets().size(), 2u);
    EXPECT_EQ(limited->unopenedBuckets(), (std::vector<std::string>{"b3", "b4"}));

    expectStorageError([&] { makePatchOfDb(*limited); }, storage::ErrorCode::BUCKET_LIMIT_REACHED);
    expectStorageError([&] { isEqualDb(*limited, *other); }, storage::ErrorCode::BUCKET_LIMIT_REACHED);

    limited.reset();
    removeDir(dir);
}
