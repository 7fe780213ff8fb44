// @include/database.h
#pragma once

#include "types.h"
#include "options.h"
#include "environment.h"
#include "transaction.h"
#include "cursor.h"
#include "storage_error/error_utils.h"

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nestkv {

class WriteBatch;

/**
 * @brief Long-lived handle over one environment and its bucket table.
 *
 * The bucket table is built once inside open() and never changes afterwards.
 * It holds the requested buckets plus every bucket the file already had.
 *
 * Transactions exist only for the duration of runRead/runWrite:
 *  - read bodies may return anything; read transactions are always aborted.
 *  - write bodies return storage::Result<T>. An ok result commits, an error
 *    aborts and is handed back unchanged. An exception aborts and propagates.
 * Fatal conditions (unknown bucket, misuse, engine resource exhaustion) are
 * thrown as storage::StorageError.
 */
class Database {
public:
    static storage::Result<std::unique_ptr<Database>> open(const std::string& path,
                                                           const std::vector<std::string>& buckets);
    static storage::Result<std::unique_ptr<Database>> open2(const std::string& path,
                                                            const std::vector<std::string>& buckets,
                                                            uint64_t map_size, unsigned max_buckets);
    static storage::Result<std::unique_ptr<Database>> open(const DatabaseOptions& options);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Throws TXN_STILL_OPEN while any transaction is running.
    void close();
    bool isOpen() const { return env_ != nullptr; }

    template<typename Body>
    auto runRead(Body&& body);

    template<typename Body>
    auto runWrite(Body&& body) { return runWrite(nullptr, std::forward<Body>(body)); }

    // parent == nullptr begins a top-level write. A non-null parent must be
    // the innermost live write transaction of the calling thread.
    template<typename Body>
    auto runWrite(ReadTransaction* parent, Body&& body);

    // Like runWrite, with dirty-key tracking enabled.
    template<typename Body>
    auto runRecordingWrite(ReadTransaction* parent, Body&& body);

    // Names from the environment's metadata tree, sorted.
    std::vector<std::string> getExistingBuckets();
    std::vector<std::string> buckets() const;
    bool hasBucket(const std::string& name) const { return buckets_.count(name) != 0; }
    // Buckets the file holds that did not fit under the bucket limit at open.
    const std::vector<std::string>& unopenedBuckets() const { return unopened_buckets_; }

    EnvStat stat();
    EnvInfo info();

    storage::Status write(const WriteBatch& batch);

    // First entry with key >= `key` (first entry when key is empty).
    std::optional<KeyValue> seek(const std::string& bucket, BytesView key);
    // Last entry with key < `key` (last entry when key is empty).
    std::optional<KeyValue> seekReverse(const std::string& bucket, BytesView key);

    const std::string& path() const { return path_; }
    int openTransactions() const { return open_txns_.load(); }

    static std::string version();

private:
    Database(std::unique_ptr<StorageEnvironment> env, std::string path);

    storage::Status bootstrap(const std::vector<std::string>& requested);

    void ensureOpen() const;
    MDBX_dbi dbiFor(const std::string& bucket) const;

    std::unique_ptr<ReadTransaction> beginRead();
    std::unique_ptr<ReadTransaction> beginNestedRead(ReadTransaction& parent);
    std::unique_ptr<ReadWriteTransaction> beginWrite(ReadTransaction* parent, bool recording);
    void endTransaction(ReadTransaction& txn, bool commit);
    void releaseTransaction(ReadTransaction& txn) noexcept;

    template<typename Body>
    auto runWriteImpl(ReadTransaction* parent, bool recording, Body&& body);

    std::unique_ptr<StorageEnvironment> env_;
    std::string path_;
    std::map<std::string, MDBX_dbi> buckets_;
    std::vector<std::string> unopened_buckets_;
    MDBX_dbi main_dbi_ = 0;
    WriteChain write_chain_;
    std::atomic<int> open_txns_{0};

    friend class ReadTransaction;
    friend class ReadWriteTransaction;
    friend class Cursor;
    friend class detail::TxnScope;
};

// --- Template definitions ---

template<typename Body>
auto Database::runRead(Body&& body) {
    detail::TxnScope scope(*this, beginRead());
    return body(scope.txn());
}

template<typename Body>
auto Database::runWrite(ReadTransaction* parent, Body&& body) {
    return runWriteImpl(parent, false, std::forward<Body>(body));
}

template<typename Body>
auto Database::runRecordingWrite(ReadTransaction* parent, Body&& body) {
    return runWriteImpl(parent, true, std::forward<Body>(body));
}

template<typename Body>
auto Database::runWriteImpl(ReadTransaction* parent, bool recording, Body&& body) {
    using R = std::decay_t<std::invoke_result_t<Body&, ReadWriteTransaction&>>;
    static_assert(detail::is_result<R>::value,
                  "write transaction bodies must return storage::Result<T> or storage::Status");

    detail::TxnScope scope(*this, beginWrite(parent, recording));
    R result = body(static_cast<ReadWriteTransaction&>(scope.txn()));
    if (result.isOk()) {
        scope.commit();
    } else {
        scope.abort();
    }
    return result;
}

template<typename Body>
auto ReadTransaction::runRead(Body&& body) {
    detail::TxnScope scope(db_, db_.beginNestedRead(*this));
    return body(scope.txn());
}

template<typename Body>
auto ReadWriteTransaction::runWrite(Body&& body) {
    return db_.runWrite(this, std::forward<Body>(body));
}

} // namespace nestkv
