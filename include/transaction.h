// @include/transaction.h
#pragma once

#include "types.h"
#include "cell_key.h"
#include "storage_error/result.h"

#include <mdbx.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace nestkv {

class Database;
class Cursor;
class ReadTransaction;
class ReadWriteTransaction;

namespace detail {

template<typename R> struct is_result : std::false_type {};
template<typename T> struct is_result<storage::Result<T>> : std::true_type {};

/**
 * @brief Ends a transaction on every exit path.
 *
 * commit() and abort() end it explicitly; if neither ran (the body threw),
 * the destructor aborts. Cursors are closed first in all cases.
 */
class TxnScope {
public:
    TxnScope(Database& db, std::unique_ptr<ReadTransaction> txn);
    ~TxnScope();

    TxnScope(const TxnScope&) = delete;
    TxnScope& operator=(const TxnScope&) = delete;

    ReadTransaction& txn() { return *txn_; }
    void commit();
    void abort() noexcept;

private:
    Database& db_;
    std::unique_ptr<ReadTransaction> txn_;
};

} // namespace detail

/**
 * @brief Set of (bucket, key) cells touched by a recording transaction.
 * Cells are deduplicated by their serialized CellKey.
 */
class DirtyKeySet {
public:
    void mark(const std::string& bucket, BytesView key);
    void mergeFrom(DirtyKeySet& child);
    bool contains(const std::string& bucket, BytesView key) const;

    // Sorted by (bucket, key).
    std::vector<CellKey> keys() const;

    size_t size() const { return encoded_.size(); }
    bool empty() const { return encoded_.empty(); }

private:
    std::unordered_set<std::string> encoded_;
};

/**
 * @brief Arena of the live write-transaction chain, indexed by depth.
 *
 * Frame 0 is the top-level write transaction, frame N its N-th nested
 * descendant. Only the last frame may begin a child or be used. All frames
 * belong to the thread that began frame 0.
 */
class WriteChain {
public:
    // Fails if the calling thread already drives a chain.
    void checkCanBeginRoot() const;
    // Fails unless parent is the last frame and the caller owns the chain.
    void checkIsTop(const ReadTransaction* parent) const;

    void push(ReadTransaction* txn);
    void pop(ReadTransaction* txn) noexcept;

    size_t depth() const;
    bool active() const { return depth() > 0; }

private:
    mutable std::mutex mutex_;
    std::vector<ReadTransaction*> frames_;
    std::thread::id owner_;
};

/**
 * @brief Scoped read handle. Created only by Database; lives for one
 * runRead call and is always aborted at the end.
 */
class ReadTransaction {
public:
    virtual ~ReadTransaction();

    ReadTransaction(const ReadTransaction&) = delete;
    ReadTransaction& operator=(const ReadTransaction&) = delete;

    std::optional<Bytes> get(const std::string& bucket, BytesView key);

    // The view stays valid until the transaction ends or the cell is next
    // written. Do not keep it longer.
    std::optional<BytesView> getNoCopy(const std::string& bucket, BytesView key);

    BucketStat bucketStat(const std::string& bucket);

    // nullptr for an empty bucket; otherwise positioned at the first entry.
    // The cursor is owned by this transaction and closed when it ends.
    Cursor* openCursor(const std::string& bucket);

    // Nested read. Inside a write transaction it sees the parent's
    // uncommitted writes.
    template<typename Body>
    auto runRead(Body&& body);

    TxnMode mode() const { return mode_; }
    TxnState state() const { return state_; }
    size_t depth() const { return depth_; }
    bool isActive() const { return state_ == TxnState::ACTIVE; }
    TxnId id() const;
    Database& database() const { return db_; }

protected:
    ReadTransaction(Database& db, MDBX_txn* handle, TxnMode mode, size_t depth,
                    ReadTransaction* parent, bool owns_handle);

    MDBX_dbi resolveBucket(const std::string& bucket) const;
    // Throws unless this transaction may be used right now from this thread.
    void checkUsable() const;
    void closeCursors() noexcept;
    virtual void onCommitted() {}

    Database& db_;
    MDBX_txn* handle_;
    TxnMode mode_;
    TxnState state_ = TxnState::ACTIVE;
    size_t depth_;
    ReadTransaction* parent_;
    bool owns_handle_;
    bool in_write_chain_ = false;
    bool has_live_child_ = false;
    std::optional<std::thread::id> pinned_thread_;
    std::vector<std::unique_ptr<Cursor>> cursors_;

    friend class Database;
    friend class Cursor;
};

/**
 * @brief Scoped write handle. A write transaction has at most one live
 * child; writes of a committed child become visible to the parent.
 *
 * A recording transaction tracks every cell it or its committed children
 * touched. The capability is fixed at construction and passed to children.
 */
class ReadWriteTransaction : public ReadTransaction {
public:
    void put(const std::string& bucket, BytesView key, BytesView value);
    // Absent keys are not an error.
    void del(const std::string& bucket, BytesView key);
    void clearBucket(const std::string& bucket);
    void applyPatch(const TxnPatch& patch);

    template<typename Body>
    auto runWrite(Body&& body);

    bool isRecording() const { return dirty_ != nullptr; }
    const DirtyKeySet* dirtyKeys() const { return dirty_.get(); }

private:
    ReadWriteTransaction(Database& db, MDBX_txn* handle, size_t depth,
                         ReadTransaction* parent, std::unique_ptr<DirtyKeySet> dirty);

    void markDirty(const std::string& bucket, BytesView key);
    void onCommitted() override;

    std::unique_ptr<DirtyKeySet> dirty_;

    friend class Database;
    friend class Cursor;
};

} // namespace nestkv
