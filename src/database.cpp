// @src/database.cpp
#include "../include/database.h"
#include "../include/write_batch.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

#include <algorithm>

namespace nestkv {

Database::Database(std::unique_ptr<StorageEnvironment> env, std::string path)
    : env_(std::move(env)), path_(std::move(path)) {}

Database::~Database() {
    if (!env_) {
        return;
    }
    int open = open_txns_.load();
    if (open > 0) {
        LOG_FATAL("[Database] Destroyed with ", open, " open transaction(s): ", path_);
    }
    buckets_.clear();
    env_.reset();
}

storage::Result<std::unique_ptr<Database>> Database::open(const std::string& path,
                                                          const std::vector<std::string>& buckets) {
    DatabaseOptions options;
    options.path = path;
    options.buckets = buckets;
    return open(options);
}

storage::Result<std::unique_ptr<Database>> Database::open2(const std::string& path,
                                                           const std::vector<std::string>& buckets,
                                                           uint64_t map_size, unsigned max_buckets) {
    DatabaseOptions options;
    options.path = path;
    options.buckets = buckets;
    options.map_size = map_size;
    options.max_buckets = max_buckets;
    return open(options);
}

storage::Result<std::unique_ptr<Database>> Database::open(const DatabaseOptions& options) {
    RETURN_IF_ERROR(options.validate());

    ASSIGN_OR_RETURN_AUTO(env, StorageEnvironment::open(options));
    std::unique_ptr<Database> db(new Database(std::move(env), options.path));
    RETURN_IF_ERROR(db->bootstrap(options.buckets));

    LOG_INFO("[Database] Ready at '", options.path, "' with ", db->buckets_.size(), " bucket(s)");
    return db;
}

storage::Status Database::bootstrap(const std::vector<std::string>& requested) {
    MDBX_txn* txn = nullptr;
    try {
        txn = env_->beginTxn(nullptr, TxnMode::READ_WRITE);
    } catch (const storage::StorageError& e) {
        return e;
    }

    std::map<std::string, MDBX_dbi> table;
    auto fail = [&](int rc, const std::string& op) -> storage::StorageError {
        env_->abortTxn(txn);
        return translateMdbxError(rc, op).withFilePath(path_);
    };

    int rc = mdbx_dbi_open(txn, nullptr, MDBX_DB_DEFAULTS, &main_dbi_);
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_dbi_open(main)");

    for (const auto& name : requested) {
        MDBX_dbi dbi = 0;
        rc = mdbx_dbi_open(txn, name.c_str(), MDBX_CREATE, &dbi);
        if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_dbi_open(" + name + ")");
        table[name] = dbi;
    }

    // Buckets the file already has join the table so full scans see them.
    MDBX_cursor* cursor = nullptr;
    rc = mdbx_cursor_open(txn, main_dbi_, &cursor);
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_cursor_open(main)");

    std::vector<std::string> existing;
    MDBX_val k{nullptr, 0};
    MDBX_val v{nullptr, 0};
    rc = mdbx_cursor_get(cursor, &k, &v, MDBX_FIRST);
    while (rc == MDBX_SUCCESS) {
        existing.emplace_back(static_cast<const char*>(k.iov_base), k.iov_len);
        rc = mdbx_cursor_get(cursor, &k, &v, MDBX_NEXT);
    }
    mdbx_cursor_close(cursor);
    if (rc != MDBX_NOTFOUND) return fail(rc, "mdbx_cursor_get(main)");

    std::vector<std::string> unopened;
    for (size_t i = 0; i < existing.size(); ++i) {
        const std::string& name = existing[i];
        if (table.count(name)) {
            continue;
        }
        MDBX_dbi dbi = 0;
        rc = mdbx_dbi_open(txn, name.c_str(), MDBX_DB_DEFAULTS, &dbi);
        if (rc == MDBX_INCOMPATIBLE) {
            LOG_WARN("[Database] Skipping main-tree record '", format_key_for_print(name), "': not a bucket");
            continue;
        }
        if (rc == MDBX_DBS_FULL) {
            for (size_t j = i; j < existing.size(); ++j) {
                if (!table.count(existing[j])) {
                    unopened.push_back(existing[j]);
                }
            }
            LOG_WARN("[Database] Bucket limit reached; ", unopened.size(), " existing bucket(s) stay unopened");
            break;
        }
        if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_dbi_open(" + name + ")");
        table[name] = dbi;
    }

    rc = mdbx_txn_commit(txn);
    if (rc != MDBX_SUCCESS) {
        return translateMdbxError(rc, "mdbx_txn_commit(bootstrap)").withFilePath(path_);
    }

    buckets_ = std::move(table);
    unopened_buckets_ = std::move(unopened);
    return storage::OkStatus();
}

void Database::close() {
    if (!env_) {
        return;
    }
    int open = open_txns_.load();
    if (open > 0) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_STILL_OPEN,
            "Database::close called while transactions are open")
            .withContext("open_transactions", std::to_string(open))
            .withFilePath(path_);
    }
    buckets_.clear();
    unopened_buckets_.clear();
    env_.reset();
    LOG_INFO("[Database] Closed '", path_, "'");
}

void Database::ensureOpen() const {
    if (!env_) {
        throw storage::StorageError::usage(storage::ErrorCode::STORAGE_NOT_INITIALIZED,
            "Database is closed")
            .withFilePath(path_);
    }
}

MDBX_dbi Database::dbiFor(const std::string& bucket) const {
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        throw storage::StorageError::bucketNotFound(bucket);
    }
    return it->second;
}

std::vector<std::string> Database::buckets() const {
    std::vector<std::string> names;
    names.reserve(buckets_.size());
    for (const auto& [name, dbi] : buckets_) {
        names.push_back(name);
    }
    return names;
}

// --- Transaction lifecycle ---

std::unique_ptr<ReadTransaction> Database::beginRead() {
    ensureOpen();
    MDBX_txn* handle = env_->beginTxn(nullptr, TxnMode::READ_ONLY);
    std::unique_ptr<ReadTransaction> txn;
    try {
        txn.reset(new ReadTransaction(*this, handle, TxnMode::READ_ONLY, 0, nullptr, true));
    } catch (...) {
        env_->abortTxn(handle);
        throw;
    }
    open_txns_.fetch_add(1);
    return txn;
}

std::unique_ptr<ReadTransaction> Database::beginNestedRead(ReadTransaction& parent) {
    ensureOpen();
    parent.checkUsable();

    std::unique_ptr<ReadTransaction> txn;
    if (parent.mode() == TxnMode::READ_ONLY) {
        // Same snapshot; borrow the parent's handle.
        txn.reset(new ReadTransaction(*this, parent.handle_, TxnMode::READ_ONLY,
                                      parent.depth_ + 1, &parent, false));
        txn->pinned_thread_ = parent.pinned_thread_;
    } else {
        // A child write transaction that is never committed gives a read
        // view of the parent's uncommitted state.
        write_chain_.checkIsTop(&parent);
        MDBX_txn* handle = env_->beginTxn(parent.handle_, TxnMode::READ_WRITE);
        try {
            txn.reset(new ReadTransaction(*this, handle, TxnMode::READ_ONLY,
                                          parent.depth_ + 1, &parent, true));
            write_chain_.push(txn.get());
        } catch (...) {
            env_->abortTxn(handle);
            throw;
        }
        txn->in_write_chain_ = true;
        txn->pinned_thread_ = std::this_thread::get_id();
    }
    parent.has_live_child_ = true;
    open_txns_.fetch_add(1);
    return txn;
}

std::unique_ptr<ReadWriteTransaction> Database::beginWrite(ReadTransaction* parent, bool recording) {
    ensureOpen();

    MDBX_txn* parent_handle = nullptr;
    size_t depth = 0;
    if (parent) {
        if (parent->mode() != TxnMode::READ_WRITE) {
            throw storage::StorageError::usage(storage::ErrorCode::TXN_NESTING_VIOLATION,
                "Write transaction cannot be nested inside a read transaction")
                .withContext("parent_depth", std::to_string(parent->depth()));
        }
        parent->checkUsable();
        write_chain_.checkIsTop(parent);
        recording = recording || static_cast<ReadWriteTransaction*>(parent)->isRecording();
        parent_handle = parent->handle_;
        depth = parent->depth_ + 1;
    } else {
        write_chain_.checkCanBeginRoot();
    }

    // Blocks here while another thread's write chain is live.
    MDBX_txn* handle = env_->beginTxn(parent_handle, TxnMode::READ_WRITE);
    std::unique_ptr<ReadWriteTransaction> txn;
    try {
        std::unique_ptr<DirtyKeySet> dirty;
        if (recording) {
            dirty = std::make_unique<DirtyKeySet>();
        }
        txn.reset(new ReadWriteTransaction(*this, handle, depth, parent, std::move(dirty)));
        write_chain_.push(txn.get());
    } catch (...) {
        env_->abortTxn(handle);
        throw;
    }
    txn->in_write_chain_ = true;
    txn->pinned_thread_ = std::this_thread::get_id();
    if (parent) {
        parent->has_live_child_ = true;
    }
    open_txns_.fetch_add(1);
    LOG_TRACE("[Database] Began write transaction at depth ", depth, recording ? " (recording)" : "");
    return txn;
}

void Database::releaseTransaction(ReadTransaction& txn) noexcept {
    if (txn.state_ != TxnState::ACTIVE) {
        return;
    }
    txn.closeCursors();
    if (txn.in_write_chain_) {
        write_chain_.pop(&txn);
    }
    if (txn.parent_) {
        txn.parent_->has_live_child_ = false;
    }
    open_txns_.fetch_sub(1);

    MDBX_txn* handle = txn.handle_;
    txn.handle_ = nullptr;
    txn.state_ = TxnState::ABORTED;
    if (txn.owns_handle_ && handle) {
        env_->abortTxn(handle);
    }
}

void Database::endTransaction(ReadTransaction& txn, bool commit) {
    if (!commit || txn.mode() != TxnMode::READ_WRITE) {
        releaseTransaction(txn);
        return;
    }
    if (txn.state_ != TxnState::ACTIVE) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_NOT_ACTIVE,
            "Commit of a transaction that has already ended");
    }

    txn.closeCursors();
    write_chain_.pop(&txn);
    if (txn.parent_) {
        txn.parent_->has_live_child_ = false;
    }
    open_txns_.fetch_sub(1);

    MDBX_txn* handle = txn.handle_;
    txn.handle_ = nullptr;
    // Stays ABORTED if the engine rejects the commit; the handle is gone either way.
    txn.state_ = TxnState::ABORTED;
    env_->commitTxn(handle);
    txn.state_ = TxnState::COMMITTED;
    txn.onCommitted();
}

// --- Metadata ---

std::vector<std::string> Database::getExistingBuckets() {
    return runRead([this](ReadTransaction& txn) {
        txn.checkUsable();
        MDBX_cursor* raw = nullptr;
        checkMdbx(mdbx_cursor_open(txn.handle_, main_dbi_, &raw), "mdbx_cursor_open(main)");
        std::unique_ptr<MDBX_cursor, decltype(&mdbx_cursor_close)> guard(raw, &mdbx_cursor_close);

        std::vector<std::string> names;
        MDBX_val k{nullptr, 0};
        MDBX_val v{nullptr, 0};
        int rc = mdbx_cursor_get(raw, &k, &v, MDBX_FIRST);
        while (rc == MDBX_SUCCESS) {
            names.emplace_back(static_cast<const char*>(k.iov_base), k.iov_len);
            rc = mdbx_cursor_get(raw, &k, &v, MDBX_NEXT);
        }
        if (rc != MDBX_NOTFOUND) {
            checkMdbx(rc, "mdbx_cursor_get(main)");
        }
        std::sort(names.begin(), names.end());
        return names;
    });
}

EnvStat Database::stat() {
    ensureOpen();
    EnvStat out;
    out.main = env_->mainStat();
    out.bucket_count = static_cast<uint32_t>(buckets_.size());
    out.total_entries = runRead([this](ReadTransaction& txn) {
        uint64_t total = 0;
        for (const auto& [name, dbi] : buckets_) {
            total += txn.bucketStat(name).entries;
        }
        return total;
    });
    return out;
}

EnvInfo Database::info() {
    ensureOpen();
    return env_->info();
}

std::string Database::version() {
    return StorageEnvironment::version();
}

// --- Convenience ---

storage::Status Database::write(const WriteBatch& batch) {
    if (batch.empty()) {
        return storage::OkStatus();
    }
    return runWrite([&batch](ReadWriteTransaction& txn) -> storage::Status {
        txn.applyPatch(batch.patch());
        return storage::OkStatus();
    });
}

std::optional<KeyValue> Database::seek(const std::string& bucket, BytesView key) {
    return runRead([&](ReadTransaction& txn) -> std::optional<KeyValue> {
        Cursor* cursor = txn.openCursor(bucket);
        if (!cursor) {
            return std::nullopt;
        }
        if (!key.empty() && !cursor->seekGE(key)) {
            return std::nullopt;
        }
        return cursor->get();
    });
}

std::optional<KeyValue> Database::seekReverse(const std::string& bucket, BytesView key) {
    return runRead([&](ReadTransaction& txn) -> std::optional<KeyValue> {
        Cursor* cursor = txn.openCursor(bucket);
        if (!cursor) {
            return std::nullopt;
        }
        if (key.empty()) {
            cursor->seekLast();
            return cursor->get();
        }
        if (!cursor->seekGE(key)) {
            // Every key is smaller.
            cursor->seekLast();
            return cursor->get();
        }
        if (!cursor->previous()) {
            return std::nullopt;
        }
        return cursor->get();
    });
}

} // namespace nestkv
