//src/test/transaction.test.cpp
#include "test_helpers.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace nestkv;
using nestkv::test::DatabaseTestBase;
using nestkv::test::appError;
using nestkv::test::expectStorageError;
using storage::ErrorCode;
using storage::Status;

class TransactionTest : public DatabaseTestBase {};

TEST_F(TransactionTest, CommittedWriteIsVisibleToLaterReads) {
    putCommitted("B", "k", "v");
    auto value = readCommitted("B", "k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v");
    EXPECT_EQ(db->openTransactions(), 0);
}

TEST_F(TransactionTest, MissingKeyIsNotAnError) {
    auto value = readCommitted("B", "absent");
    EXPECT_FALSE(value.has_value());

    Status status = db->runWrite([](ReadWriteTransaction& txn) -> Status {
        txn.del("B", "absent");
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
}

TEST_F(TransactionTest, WriteBodyValueIsReturned) {
    storage::Result<int> result = db->runWrite([](ReadWriteTransaction& txn) -> storage::Result<int> {
        txn.put("B", "n", "42");
        return 42;
    });
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(readCommitted("B", "n").value_or(""), "42");
}

TEST_F(TransactionTest, NestedCommitAbortScenario) {
    Status status = db->runWrite([](ReadWriteTransaction& outer) -> Status {
        outer.put("B", "a", "1");

        Status committed = outer.runWrite([](ReadWriteTransaction& inner) -> Status {
            inner.put("B", "b", "2");
            return storage::OkStatus();
        });
        EXPECT_TRUE(committed.isOk());

        Status aborted = outer.runWrite([](ReadWriteTransaction& inner) -> Status {
            inner.put("B", "c", "3");
            return appError("inner fails");
        });
        EXPECT_FALSE(aborted.isOk());
        EXPECT_EQ(aborted.error().code, ErrorCode::APPLICATION_ERROR);
        EXPECT_EQ(aborted.error().message, "inner fails");

        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());

    EXPECT_EQ(readCommitted("B", "a").value_or(""), "1");
    EXPECT_EQ(readCommitted("B", "b").value_or(""), "2");
    EXPECT_FALSE(readCommitted("B", "c").has_value());
    auto entries = db->runRead([](ReadTransaction& txn) { return txn.bucketStat("B").entries; });
    EXPECT_EQ(entries, 2u);
}

TEST_F(TransactionTest, ChildCommitVisibleToParentAndLaterSiblings) {
    Status status = db->runWrite([](ReadWriteTransaction& outer) -> Status {
        Status first = outer.runWrite([](ReadWriteTransaction& child) -> Status {
            child.put("B", "x", "from-child");
            return storage::OkStatus();
        });
        EXPECT_TRUE(first.isOk());
        EXPECT_EQ(outer.get("B", "x").value_or(""), "from-child");

        Status second = outer.runWrite([](ReadWriteTransaction& sibling) -> Status {
            EXPECT_EQ(sibling.get("B", "x").value_or(""), "from-child");
            return storage::OkStatus();
        });
        EXPECT_TRUE(second.isOk());
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
}

TEST_F(TransactionTest, ChildAbortInvisibleToParent) {
    Status status = db->runWrite([](ReadWriteTransaction& outer) -> Status {
        Status child_status = outer.runWrite([](ReadWriteTransaction& child) -> Status {
            child.put("B", "x", "gone");
            EXPECT_EQ(child.get("B", "x").value_or(""), "gone");
            return appError();
        });
        EXPECT_FALSE(child_status.isOk());
        EXPECT_FALSE(outer.get("B", "x").has_value());
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
    EXPECT_FALSE(readCommitted("B", "x").has_value());
}

TEST_F(TransactionTest, OuterAbortDiscardsCommittedChildren) {
    putCommitted("B", "keep", "old");

    Status status = db->runWrite([](ReadWriteTransaction& outer) -> Status {
        outer.put("B", "keep", "new");
        for (int i = 0; i < 3; ++i) {
            Status s = outer.runWrite([i](ReadWriteTransaction& child) -> Status {
                child.put("B", "child" + std::to_string(i), "v");
                return child.runWrite([i](ReadWriteTransaction& grandchild) -> Status {
                    grandchild.put("B", "grandchild" + std::to_string(i), "v");
                    return storage::OkStatus();
                });
            });
            EXPECT_TRUE(s.isOk());
        }
        return appError("outer fails");
    });
    ASSERT_FALSE(status.isOk());
    EXPECT_EQ(status.error().message, "outer fails");

    EXPECT_EQ(readCommitted("B", "keep").value_or(""), "old");
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(readCommitted("B", "child" + std::to_string(i)).has_value());
        EXPECT_FALSE(readCommitted("B", "grandchild" + std::to_string(i)).has_value());
    }
    EXPECT_EQ(db->openTransactions(), 0);
}

TEST_F(TransactionTest, DeepNestingCommitsAllLevels) {
    std::function<Status(ReadWriteTransaction&, int)> nest = [&](ReadWriteTransaction& txn, int level) -> Status {
        txn.put("B", "level" + std::to_string(level), std::to_string(level));
        if (level == 5) {
            return storage::OkStatus();
        }
        return txn.runWrite([&, level](ReadWriteTransaction& child) { return nest(child, level + 1); });
    };
    Status status = db->runWrite([&](ReadWriteTransaction& txn) { return nest(txn, 0); });
    ASSERT_TRUE(status.isOk());
    for (int level = 0; level <= 5; ++level) {
        EXPECT_EQ(readCommitted("B", "level" + std::to_string(level)).value_or(""), std::to_string(level));
    }
}

TEST_F(TransactionTest, ExceptionInBodyAbortsAndPropagates) {
    EXPECT_THROW(
        db->runWrite([](ReadWriteTransaction& txn) -> Status {
            txn.put("B", "k", "v");
            throw std::runtime_error("fault");
        }),
        std::runtime_error);

    EXPECT_FALSE(readCommitted("B", "k").has_value());
    EXPECT_EQ(db->openTransactions(), 0);

    // The chain is free again.
    putCommitted("B", "after", "ok");
    EXPECT_EQ(readCommitted("B", "after").value_or(""), "ok");
}

TEST_F(TransactionTest, ExceptionInNestedBodyAbortsWholeChain) {
    EXPECT_THROW(
        db->runWrite([](ReadWriteTransaction& outer) -> Status {
            outer.put("B", "outer", "v");
            return outer.runWrite([](ReadWriteTransaction& inner) -> Status {
                inner.put("B", "inner", "v");
                throw std::runtime_error("nested fault");
            });
        }),
        std::runtime_error);

    EXPECT_FALSE(readCommitted("B", "outer").has_value());
    EXPECT_FALSE(readCommitted("B", "inner").has_value());
    EXPECT_EQ(db->openTransactions(), 0);
}

TEST_F(TransactionTest, UnknownBucketIsFatal) {
    expectStorageError([&] {
        db->runWrite([](ReadWriteTransaction& txn) -> Status {
            txn.put("B", "k", "v");
            txn.put("no-such-bucket", "k", "v");
            return storage::OkStatus();
        });
    }, ErrorCode::BUCKET_NOT_FOUND);
    EXPECT_FALSE(readCommitted("B", "k").has_value());

    expectStorageError([&] {
        db->runRead([](ReadTransaction& txn) { return txn.get("no-such-bucket", "k"); });
    }, ErrorCode::BUCKET_NOT_FOUND);
}

TEST_F(TransactionTest, NestedReadInsideWriteSeesUncommittedState) {
    Status status = db->runWrite([](ReadWriteTransaction& txn) -> Status {
        txn.put("B", "pending", "1");
        auto seen = txn.runRead([](ReadTransaction& view) { return view.get("B", "pending"); });
        EXPECT_EQ(seen.value_or(""), "1");
        // Parent is usable again once the view ended.
        txn.put("B", "pending", "2");
        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(readCommitted("B", "pending").value_or(""), "2");
}

TEST_F(TransactionTest, NestedReadInsideReadSharesSnapshot) {
    putCommitted("B", "k", "v");
    auto value = db->runRead([](ReadTransaction& txn) {
        EXPECT_EQ(txn.depth(), 0u);
        return txn.runRead([](ReadTransaction& nested) {
            EXPECT_EQ(nested.depth(), 1u);
            return nested.get("B", "k");
        });
    });
    EXPECT_EQ(value.value_or(""), "v");
}

TEST_F(TransactionTest, WriteInsideReadIsUsageError) {
    db->runRead([&](ReadTransaction& txn) {
        expectStorageError([&] {
            db->runWrite(&txn, [](ReadWriteTransaction&) -> Status { return storage::OkStatus(); });
        }, ErrorCode::TXN_NESTING_VIOLATION);
        return 0;
    });
}

TEST_F(TransactionTest, ParentIsSuspendedWhileChildRuns) {
    Status status = db->runWrite([&](ReadWriteTransaction& outer) -> Status {
        return outer.runWrite([&](ReadWriteTransaction& child) -> Status {
            expectStorageError([&] { outer.put("B", "k", "v"); }, ErrorCode::TXN_NOT_ACTIVE);
            // A sibling of child cannot start while child is live.
            expectStorageError([&] {
                db->runWrite(&outer, [](ReadWriteTransaction&) -> Status { return storage::OkStatus(); });
            }, ErrorCode::TXN_NOT_ACTIVE);
            child.put("B", "k", "child");
            return storage::OkStatus();
        });
    });
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(readCommitted("B", "k").value_or(""), "child");
}

TEST_F(TransactionTest, SecondTopLevelWriteOnSameThreadIsRejected) {
    Status status = db->runWrite([&](ReadWriteTransaction& txn) -> Status {
        expectStorageError([&] {
            db->runWrite([](ReadWriteTransaction&) -> Status { return storage::OkStatus(); });
        }, ErrorCode::TXN_NESTING_VIOLATION);
        txn.put("B", "k", "v");
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
}

TEST_F(TransactionTest, WriteTransactionIsPinnedToItsThread) {
    Status status = db->runWrite([&](ReadWriteTransaction& txn) -> Status {
        std::atomic<int> code{0};
        std::thread other([&] {
            try {
                txn.put("B", "k", "v");
            } catch (const storage::StorageError& e) {
                code = static_cast<int>(e.code);
            }
        });
        other.join();
        EXPECT_EQ(code.load(), static_cast<int>(ErrorCode::TXN_THREAD_MISMATCH));
        return storage::OkStatus();
    });
    EXPECT_TRUE(status.isOk());
    EXPECT_FALSE(readCommitted("B", "k").has_value());
}

TEST_F(TransactionTest, ReadersDoNotSeeUncommittedWrites) {
    Status status = db->runWrite([&](ReadWriteTransaction& txn) -> Status {
        txn.put("B", "k", "uncommitted");
        std::optional<std::string> seen = std::string("sentinel");
        std::thread reader([&] {
            seen = db->runRead([](ReadTransaction& r) { return r.get("B", "k"); });
        });
        reader.join();
        EXPECT_FALSE(seen.has_value());
        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(readCommitted("B", "k").value_or(""), "uncommitted");
}

TEST_F(TransactionTest, TopLevelReadOnWriterThreadSeesCommittedState) {
    putCommitted("B", "foo", "bar");
    Status status = db->runWrite([&](ReadWriteTransaction& txn) -> Status {
        txn.put("B", "foo2", "bar2");
        db->runRead([](ReadTransaction& r) {
            EXPECT_EQ(r.get("B", "foo").value_or(""), "bar");
            EXPECT_FALSE(r.get("B", "foo2").has_value());
            return 0;
        });
        // Helpers that open their own read transaction work here too.
        EXPECT_EQ(db->stat().total_entries, 1u);
        EXPECT_EQ(db->getExistingBuckets(), std::vector<std::string>{"B"});
        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(readCommitted("B", "foo2").value_or(""), "bar2");
}

TEST_F(TransactionTest, SecondWriterWaitsForFirstChain) {
    std::thread second;
    std::atomic<bool> second_done{false};
    Status status = db->runWrite([&](ReadWriteTransaction& txn) -> Status {
        txn.put("B", "first", "1");
        second = std::thread([&] {
            Status s = db->runWrite([](ReadWriteTransaction& t) -> Status {
                EXPECT_EQ(t.get("B", "first").value_or(""), "1");
                t.put("B", "second", "2");
                return storage::OkStatus();
            });
            EXPECT_TRUE(s.isOk());
            second_done = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(second_done.load());
        return storage::OkStatus();
    });
    second.join();
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(readCommitted("B", "second").value_or(""), "2");
}

TEST_F(TransactionTest, ClearBucketRemovesEverything) {
    for (int i = 0; i < 10; ++i) {
        putCommitted("B", "k" + std::to_string(i), "v");
    }
    Status status = db->runWrite([](ReadWriteTransaction& txn) -> Status {
        txn.clearBucket("B");
        EXPECT_EQ(txn.bucketStat("B").entries, 0u);
        return storage::OkStatus();
    });
    ASSERT_TRUE(status.isOk());
    auto entries = db->runRead([](ReadTransaction& txn) { return txn.bucketStat("B").entries; });
    EXPECT_EQ(entries, 0u);
}

TEST_F(TransactionTest, GetNoCopyViewsStoredBytes) {
    std::string binary("a\0b\xff", 4);
    putCommitted("B", binary, binary);
    bool matched = db->runRead([&](ReadTransaction& txn) {
        auto view = txn.getNoCopy("B", binary);
        return view.has_value() && *view == binary;
    });
    EXPECT_TRUE(matched);
}

TEST_F(TransactionTest, CloseWithOpenTransactionFails) {
    db->runRead([&](ReadTransaction&) {
        expectStorageError([&] { db->close(); }, ErrorCode::TXN_STILL_OPEN);
        return 0;
    });
    EXPECT_TRUE(db->isOpen());
    db->close();
    EXPECT_FALSE(db->isOpen());
    expectStorageError([&] { db->runRead([](ReadTransaction&) { return 0; }); },
                       ErrorCode::STORAGE_NOT_INITIALIZED);
}
