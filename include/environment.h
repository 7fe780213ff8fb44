// @include/environment.h
#pragma once

#include "types.h"
#include "options.h"
#include "storage_error/storage_error.h"
#include "storage_error/result.h"

#include <mdbx.h>

#include <memory>
#include <string>

namespace nestkv {

// Maps a libmdbx return code to a StorageError. Never called with MDBX_SUCCESS.
storage::StorageError translateMdbxError(int rc, const std::string& operation);

// Throws the translated error for any rc other than MDBX_SUCCESS.
void checkMdbx(int rc, const char* operation);

/**
 * @brief Owns the libmdbx environment handle.
 *
 * Only Database creates and destroys it. Transactions borrow it through
 * Database and never close it.
 */
class StorageEnvironment {
public:
    static storage::Result<std::unique_ptr<StorageEnvironment>> open(const DatabaseOptions& options);

    ~StorageEnvironment();

    StorageEnvironment(const StorageEnvironment&) = delete;
    StorageEnvironment& operator=(const StorageEnvironment&) = delete;

    // Blocks while another top-level write transaction is active.
    MDBX_txn* beginTxn(MDBX_txn* parent, TxnMode mode);
    void commitTxn(MDBX_txn* txn);
    void abortTxn(MDBX_txn* txn) noexcept;

    EnvInfo info() const;
    BucketStat mainStat() const;

    MDBX_env* handle() const { return env_; }
    const std::string& path() const { return path_; }

    static std::string version();

private:
    StorageEnvironment(MDBX_env* env, std::string path);

    MDBX_env* env_;
    std::string path_;
};

BucketStat toBucketStat(const MDBX_stat& st);

} // namespace nestkv
