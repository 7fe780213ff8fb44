//src/test/cursor.test.cpp
#include "test_helpers.h"

using namespace nestkv;
using nestkv::test::DatabaseTestBase;
using nestkv::test::expectStorageError;
using storage::ErrorCode;
using storage::Status;

class CursorTest : public DatabaseTestBase {
protected:
    std::vector<std::string> bucketNames() const override { return {"B", "Empty"}; }

    void SetUp() override {
        DatabaseTestBase::SetUp();
        putCommitted("B", "k1", "v1");
        putCommitted("B", "k2", "v2");
        putCommitted("B", "k3", "v3");
    }
};

TEST_F(CursorTest, EmptyBucketHasNoCursor) {
    bool is_null = db->runRead([](ReadTransaction& txn) { return txn.openCursor("Empty") == nullptr; });
    EXPECT_TRUE(is_null);
}

TEST_F(CursorTest, OpenCursorStartsAtFirstEntry) {
    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;
        EXPECT_TRUE(cursor->isPositioned());
        EXPECT_EQ(cursor->get().key, "k1");
        EXPECT_EQ(cursor->bucket(), "B");
        return 0;
    });
}

TEST_F(CursorTest, NextStopsOnLastEntry) {
    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;
        EXPECT_TRUE(cursor->seekFirst());
        EXPECT_EQ(cursor->get().key, "k1");
        EXPECT_TRUE(cursor->next());
        EXPECT_TRUE(cursor->next());
        EXPECT_EQ(cursor->get().key, "k3");
        EXPECT_FALSE(cursor->next());
        KeyValue kv = cursor->get();
        EXPECT_EQ(kv.key, "k3");
        EXPECT_EQ(kv.value, "v3");
        EXPECT_FALSE(cursor->next());
        EXPECT_EQ(cursor->get().key, "k3");
        return 0;
    });
}

TEST_F(CursorTest, PreviousStopsOnFirstEntry) {
    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;
        EXPECT_TRUE(cursor->seekLast());
        EXPECT_EQ(cursor->get().key, "k3");
        EXPECT_TRUE(cursor->previous());
        EXPECT_TRUE(cursor->previous());
        EXPECT_FALSE(cursor->previous());
        EXPECT_EQ(cursor->get().key, "k1");
        return 0;
    });
}

TEST_F(CursorTest, SeekOperations) {
    putCommitted("B", "prefix/a", "pa");
    putCommitted("B", "prefix/b", "pb");

    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;

        EXPECT_TRUE(cursor->seekExact("k2"));
        EXPECT_EQ(cursor->get().value, "v2");

        EXPECT_FALSE(cursor->seekExact("k25"));
        EXPECT_FALSE(cursor->isPositioned());

        EXPECT_TRUE(cursor->seekGE("k25"));
        EXPECT_EQ(cursor->get().key, "k3");

        EXPECT_TRUE(cursor->seekByPrefix("prefix/"));
        EXPECT_EQ(cursor->get().key, "prefix/a");
        EXPECT_TRUE(cursor->next());
        EXPECT_EQ(cursor->get().key, "prefix/b");

        EXPECT_FALSE(cursor->seekByPrefix("nothing"));
        EXPECT_FALSE(cursor->isPositioned());

        EXPECT_FALSE(cursor->seekGE("zzz"));
        return 0;
    });
}

TEST_F(CursorTest, GetOnUnpositionedOrClosedCursorFails) {
    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;

        EXPECT_FALSE(cursor->seekExact("missing"));
        expectStorageError([&] { cursor->get(); }, ErrorCode::CURSOR_NOT_POSITIONED);

        cursor->close();
        cursor->close(); // idempotent
        EXPECT_TRUE(cursor->isClosed());
        expectStorageError([&] { cursor->get(); }, ErrorCode::CURSOR_CLOSED);
        expectStorageError([&] { cursor->seekFirst(); }, ErrorCode::CURSOR_CLOSED);
        return 0;
    });
}

TEST_F(CursorTest, FullScanVisitsEntriesInOrder) {
    std::vector<std::string> keys = db->runRead([](ReadTransaction& txn) {
        std::vector<std::string> out;
        Cursor* cursor = txn.openCursor("B");
        if (!cursor) return out;
        do {
            out.push_back(cursor->get().key);
        } while (cursor->next());
        return out;
    });
    EXPECT_EQ(keys, (std::vector<std::string>{"k1", "k2", "k3"}));
}

TEST_F(CursorTest, MutationThroughCursor) {
    Status status = db->runWrite([](ReadWriteTransaction& txn) -> Status {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return storage::OkStatus();

        EXPECT_TRUE(cursor->seekExact("k2"));
        cursor->put("v2-updated");
        EXPECT_EQ(cursor->get().value, "v2-updated");

        cursor->put("k4", "v4");
        EXPECT_EQ(cursor->get().key, "k4");

        EXPECT_TRUE(cursor->seekExact("k1"));
        cursor->remove();
        EXPECT_FALSE(cursor->isPositioned());
        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());

    EXPECT_FALSE(readCommitted("B", "k1").has_value());
    EXPECT_EQ(readCommitted("B", "k2").value_or(""), "v2-updated");
    EXPECT_EQ(readCommitted("B", "k4").value_or(""), "v4");
}

TEST_F(CursorTest, MutationInReadTransactionFails) {
    db->runRead([](ReadTransaction& txn) {
        Cursor* cursor = txn.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return 0;
        expectStorageError([&] { cursor->put("x"); }, ErrorCode::TXN_READ_ONLY);
        expectStorageError([&] { cursor->remove(); }, ErrorCode::TXN_READ_ONLY);
        return 0;
    });
}

TEST_F(CursorTest, CursorOfSuspendedParentCannotBeUsed) {
    Status status = db->runWrite([](ReadWriteTransaction& outer) -> Status {
        Cursor* cursor = outer.openCursor("B");
        EXPECT_NE(cursor, nullptr);
        if (!cursor) return storage::OkStatus();
        Status inner = outer.runWrite([&](ReadWriteTransaction&) -> Status {
            expectStorageError([&] { cursor->next(); }, ErrorCode::TXN_NOT_ACTIVE);
            return storage::OkStatus();
        });
        EXPECT_TRUE(inner.isOk());
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
}
