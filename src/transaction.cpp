// @src/transaction.cpp
#include "../include/transaction.h"
#include "../include/database.h"
#include "../include/cursor.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

#include <algorithm>

namespace nestkv {

// --- detail::TxnScope ---

namespace detail {

TxnScope::TxnScope(Database& db, std::unique_ptr<ReadTransaction> txn)
    : db_(db), txn_(std::move(txn)) {}

TxnScope::~TxnScope() {
    if (txn_ && txn_->isActive()) {
        LOG_TRACE("[TxnScope] Aborting transaction at depth ", txn_->depth(), " on scope exit");
        db_.releaseTransaction(*txn_);
    }
}

void TxnScope::commit() {
    db_.endTransaction(*txn_, true);
}

void TxnScope::abort() noexcept {
    db_.releaseTransaction(*txn_);
}

} // namespace detail

// --- DirtyKeySet ---

void DirtyKeySet::mark(const std::string& bucket, BytesView key) {
    encoded_.insert(CellKey(bucket, Bytes(key)).serialize());
}

void DirtyKeySet::mergeFrom(DirtyKeySet& child) {
    if (encoded_.empty()) {
        encoded_.swap(child.encoded_);
        return;
    }
    encoded_.merge(child.encoded_);
    child.encoded_.clear();
}

bool DirtyKeySet::contains(const std::string& bucket, BytesView key) const {
    return encoded_.count(CellKey(bucket, Bytes(key)).serialize()) != 0;
}

std::vector<CellKey> DirtyKeySet::keys() const {
    std::vector<CellKey> out;
    out.reserve(encoded_.size());
    for (const auto& encoded : encoded_) {
        // Every entry was produced by CellKey::serialize; value() rethrows otherwise.
        out.push_back(CellKey::deserialize(encoded).value());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// --- WriteChain ---

void WriteChain::checkCanBeginRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frames_.empty() && owner_ == std::this_thread::get_id()) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_NESTING_VIOLATION,
            "This thread already runs a write transaction; nest through it instead")
            .withContext("depth", std::to_string(frames_.size()));
    }
}

void WriteChain::checkIsTop(const ReadTransaction* parent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty() || owner_ != std::this_thread::get_id()) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_THREAD_MISMATCH,
            "Write transaction chain is driven by another thread");
    }
    if (frames_.back() != parent) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_NESTING_VIOLATION,
            "Parent is not the innermost live write transaction")
            .withContext("chain_depth", std::to_string(frames_.size()));
    }
}

void WriteChain::push(ReadTransaction* txn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) {
        owner_ = std::this_thread::get_id();
    }
    frames_.push_back(txn);
}

void WriteChain::pop(ReadTransaction* txn) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) {
        LOG_ERROR("[WriteChain] pop on an empty chain");
        return;
    }
    if (frames_.back() != txn) {
        LOG_ERROR("[WriteChain] Ending a transaction that is not the innermost frame (depth ", frames_.size(), ")");
        auto it = std::find(frames_.begin(), frames_.end(), txn);
        frames_.erase(it, frames_.end());
    } else {
        frames_.pop_back();
    }
    if (frames_.empty()) {
        owner_ = std::thread::id();
    }
}

size_t WriteChain::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

// --- ReadTransaction ---

ReadTransaction::ReadTransaction(Database& db, MDBX_txn* handle, TxnMode mode, size_t depth,
                                 ReadTransaction* parent, bool owns_handle)
    : db_(db), handle_(handle), mode_(mode), depth_(depth), parent_(parent), owns_handle_(owns_handle) {}

ReadTransaction::~ReadTransaction() {
    closeCursors();
}

TxnId ReadTransaction::id() const {
    return handle_ ? mdbx_txn_id(handle_) : INVALID_TXN_ID;
}

MDBX_dbi ReadTransaction::resolveBucket(const std::string& bucket) const {
    return db_.dbiFor(bucket);
}

void ReadTransaction::checkUsable() const {
    if (state_ != TxnState::ACTIVE) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_NOT_ACTIVE,
            "Transaction has already ended");
    }
    if (has_live_child_) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_NOT_ACTIVE,
            "Transaction is suspended while a nested transaction runs")
            .withContext("depth", std::to_string(depth_));
    }
    if (pinned_thread_ && *pinned_thread_ != std::this_thread::get_id()) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_THREAD_MISMATCH,
            "Write transaction used from a thread other than the one that began it");
    }
}

void ReadTransaction::closeCursors() noexcept {
    for (auto& cursor : cursors_) {
        cursor->close();
    }
    cursors_.clear();
}

std::optional<Bytes> ReadTransaction::get(const std::string& bucket, BytesView key) {
    auto view = getNoCopy(bucket, key);
    if (!view) {
        return std::nullopt;
    }
    return Bytes(*view);
}

std::optional<BytesView> ReadTransaction::getNoCopy(const std::string& bucket, BytesView key) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);
    MDBX_val k{const_cast<char*>(key.data()), key.size()};
    MDBX_val v{nullptr, 0};
    int rc = mdbx_get(handle_, dbi, &k, &v);
    if (rc == MDBX_NOTFOUND) {
        return std::nullopt;
    }
    checkMdbx(rc, "mdbx_get");
    return BytesView(static_cast<const char*>(v.iov_base), v.iov_len);
}

BucketStat ReadTransaction::bucketStat(const std::string& bucket) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);
    MDBX_stat st;
    checkMdbx(mdbx_dbi_stat(handle_, dbi, &st, sizeof(st)), "mdbx_dbi_stat");
    return toBucketStat(st);
}

Cursor* ReadTransaction::openCursor(const std::string& bucket) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);
    MDBX_cursor* raw = nullptr;
    checkMdbx(mdbx_cursor_open(handle_, dbi, &raw), "mdbx_cursor_open");

    std::unique_ptr<Cursor> cursor(new Cursor(*this, bucket, raw));
    if (!cursor->seekFirst()) {
        return nullptr; // empty bucket; destructor closes the handle
    }
    cursors_.push_back(std::move(cursor));
    return cursors_.back().get();
}

// --- ReadWriteTransaction ---

ReadWriteTransaction::ReadWriteTransaction(Database& db, MDBX_txn* handle, size_t depth,
                                           ReadTransaction* parent, std::unique_ptr<DirtyKeySet> dirty)
    : ReadTransaction(db, handle, TxnMode::READ_WRITE, depth, parent, true),
      dirty_(std::move(dirty)) {}

void ReadWriteTransaction::markDirty(const std::string& bucket, BytesView key) {
    if (dirty_) {
        dirty_->mark(bucket, key);
    }
}

void ReadWriteTransaction::onCommitted() {
    auto* parent = static_cast<ReadWriteTransaction*>(parent_);
    if (dirty_ && parent && parent->dirty_) {
        parent->dirty_->mergeFrom(*dirty_);
    }
}

void ReadWriteTransaction::put(const std::string& bucket, BytesView key, BytesView value) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);
    MDBX_val k{const_cast<char*>(key.data()), key.size()};
    MDBX_val v{const_cast<char*>(value.data()), value.size()};
    checkMdbx(mdbx_put(handle_, dbi, &k, &v, MDBX_UPSERT), "mdbx_put");
    markDirty(bucket, key);
}

void ReadWriteTransaction::del(const std::string& bucket, BytesView key) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);
    MDBX_val k{const_cast<char*>(key.data()), key.size()};
    int rc = mdbx_del(handle_, dbi, &k, nullptr);
    if (rc != MDBX_NOTFOUND) {
        checkMdbx(rc, "mdbx_del");
    }
    markDirty(bucket, key);
}

void ReadWriteTransaction::clearBucket(const std::string& bucket) {
    checkUsable();
    MDBX_dbi dbi = resolveBucket(bucket);

    if (dirty_) {
        // Every removed cell must show up in the recorded patch.
        MDBX_cursor* raw = nullptr;
        checkMdbx(mdbx_cursor_open(handle_, dbi, &raw), "mdbx_cursor_open");
        std::unique_ptr<MDBX_cursor, decltype(&mdbx_cursor_close)> guard(raw, &mdbx_cursor_close);
        MDBX_val k{nullptr, 0};
        MDBX_val v{nullptr, 0};
        int rc = mdbx_cursor_get(raw, &k, &v, MDBX_FIRST);
        while (rc == MDBX_SUCCESS) {
            dirty_->mark(bucket, BytesView(static_cast<const char*>(k.iov_base), k.iov_len));
            rc = mdbx_cursor_get(raw, &k, &v, MDBX_NEXT);
        }
        if (rc != MDBX_NOTFOUND) {
            checkMdbx(rc, "mdbx_cursor_get");
        }
    }

    checkMdbx(mdbx_drop(handle_, dbi, false), "mdbx_drop");
    LOG_DEBUG("[ReadWriteTransaction] Cleared bucket '", bucket, "' at depth ", depth_);
}

void ReadWriteTransaction::applyPatch(const TxnPatch& patch) {
    for (const auto& cell : patch) {
        if (cell.exists) {
            put(cell.bucket, cell.key, cell.value);
        } else {
            del(cell.bucket, cell.key);
        }
    }
}

} // namespace nestkv
