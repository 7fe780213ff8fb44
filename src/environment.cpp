// @src/environment.cpp
#include "../include/environment.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

#include <cerrno>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace nestkv {

storage::StorageError translateMdbxError(int rc, const std::string& operation) {
    using storage::ErrorCode;
    ErrorCode code;
    switch (rc) {
        case MDBX_MAP_FULL:         code = ErrorCode::STORAGE_FULL; break;
        case MDBX_TXN_FULL:         code = ErrorCode::TXN_TOO_LARGE; break;
        case MDBX_DBS_FULL:         code = ErrorCode::BUCKET_LIMIT_REACHED; break;
        case MDBX_READERS_FULL:     code = ErrorCode::TXN_READERS_FULL; break;
        case MDBX_CORRUPTED:
        case MDBX_PAGE_NOTFOUND:    code = ErrorCode::STORAGE_CORRUPTION; break;
        case MDBX_PANIC:            code = ErrorCode::STORAGE_PANIC; break;
        case MDBX_VERSION_MISMATCH:
        case MDBX_INVALID:          code = ErrorCode::STORAGE_VERSION_MISMATCH; break;
        case MDBX_BAD_TXN:          code = ErrorCode::TXN_NOT_ACTIVE; break;
        case MDBX_BAD_DBI:          code = ErrorCode::BUCKET_NOT_FOUND; break;
        case MDBX_BAD_VALSIZE:      code = ErrorCode::INVALID_KEY; break;
        case MDBX_THREAD_MISMATCH:  code = ErrorCode::TXN_THREAD_MISMATCH; break;
        case MDBX_TXN_OVERLAPPING:  code = ErrorCode::TXN_NESTING_VIOLATION; break;
        case MDBX_ENOMEM:           code = ErrorCode::OUT_OF_MEMORY; break;
        case MDBX_EIO:              code = ErrorCode::IO_ERROR; break;
        case ENOSPC:                code = ErrorCode::DISK_FULL; break;
        case MDBX_ENOFILE:          code = ErrorCode::FILE_NOT_FOUND; break;
        case MDBX_EACCESS:
        case MDBX_EPERM:            code = ErrorCode::FILE_PERMISSION_DENIED; break;
        default:                    code = ErrorCode::STORAGE_ENGINE_ERROR; break;
    }

    storage::StorageError err(code, operation + " failed: " + mdbx_strerror(rc));
    err.withEngineCode(rc).withContext("operation", operation);
    switch (code) {
        case ErrorCode::STORAGE_FULL:
            err.withSuggestedAction("Reopen the database with a larger map size");
            break;
        case ErrorCode::TXN_TOO_LARGE:
            err.withSuggestedAction("Split the work into smaller write transactions");
            break;
        case ErrorCode::BUCKET_LIMIT_REACHED:
            err.withSuggestedAction("Reopen the database with a larger bucket limit");
            break;
        case ErrorCode::DISK_FULL:
            err.withSuggestedAction("Free disk space");
            break;
        default:
            break;
    }
    return err;
}

void checkMdbx(int rc, const char* operation) {
    if (rc != MDBX_SUCCESS) {
        throw translateMdbxError(rc, operation);
    }
}

BucketStat toBucketStat(const MDBX_stat& st) {
    BucketStat out;
    out.page_size = st.ms_psize;
    out.depth = st.ms_depth;
    out.branch_pages = st.ms_branch_pages;
    out.leaf_pages = st.ms_leaf_pages;
    out.overflow_pages = st.ms_overflow_pages;
    out.entries = st.ms_entries;
    return out;
}

StorageEnvironment::StorageEnvironment(MDBX_env* env, std::string path)
    : env_(env), path_(std::move(path)) {}

StorageEnvironment::~StorageEnvironment() {
    if (env_) {
        int rc = mdbx_env_close(env_);
        if (rc != MDBX_SUCCESS) {
            LOG_ERROR("[StorageEnvironment] Close of '", path_, "' failed: ", mdbx_strerror(rc));
        }
        env_ = nullptr;
    }
}

namespace {

// A top-level read may start on the thread that drives the write chain; it
// sees the last committed state. libmdbx only allows that in legacy-overlap
// mode, which is a process-wide debug setting.
void enableReadOverlap() {
    static std::once_flag once;
    std::call_once(once, [] {
        mdbx_setup_debug(MDBX_LOG_DONTCHANGE, MDBX_DBG_LEGACY_OVERLAP,
                         reinterpret_cast<MDBX_debug_func*>(intptr_t(-1) /* don't change */));
    });
}

} // namespace

storage::Result<std::unique_ptr<StorageEnvironment>> StorageEnvironment::open(const DatabaseOptions& options) {
    enableReadOverlap();

    if (options.create_if_missing && !options.no_subdir) {
        std::error_code ec;
        fs::create_directories(options.path, ec);
        if (ec) {
            return STORAGE_ERROR(storage::ErrorCode::STORAGE_OPEN_FAILED, "Cannot create database directory")
                .withDetails(ec.message())
                .withFilePath(options.path);
        }
    }

    MDBX_env* env = nullptr;
    int rc = mdbx_env_create(&env);
    if (rc != MDBX_SUCCESS) {
        return translateMdbxError(rc, "mdbx_env_create").withFilePath(options.path);
    }

    // Any failure from here on must release the half-configured handle.
    auto fail = [&](int code, const char* op) -> storage::StorageError {
        mdbx_env_close(env);
        storage::StorageError err = translateMdbxError(code, op);
        err.withFilePath(options.path);
        return storage::StorageError(storage::ErrorCode::STORAGE_OPEN_FAILED, err.message)
            .withEngineCode(code)
            .withDetails(std::string(storage::error_utils::errorCodeToString(err.code)))
            .withFilePath(options.path);
    };

    rc = mdbx_env_set_maxdbs(env, options.effectiveMaxBuckets());
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_env_set_maxdbs");

    rc = mdbx_env_set_maxreaders(env, options.max_readers);
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_env_set_maxreaders");

    rc = mdbx_env_set_geometry(env, -1, -1, static_cast<intptr_t>(options.map_size), -1, -1, -1);
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_env_set_geometry");

    MDBX_env_flags_t flags = MDBX_NOTLS | MDBX_NORDAHEAD;
    if (options.no_subdir) {
        flags |= MDBX_NOSUBDIR;
    }
    rc = mdbx_env_open(env, options.path.c_str(), flags, static_cast<mdbx_mode_t>(options.file_mode));
    if (rc != MDBX_SUCCESS) return fail(rc, "mdbx_env_open");

    LOG_INFO("[StorageEnvironment] Opened '", options.path, "' (map size ", options.map_size,
             ", max buckets ", options.effectiveMaxBuckets(), ")");
    return std::unique_ptr<StorageEnvironment>(new StorageEnvironment(env, options.path));
}

MDBX_txn* StorageEnvironment::beginTxn(MDBX_txn* parent, TxnMode mode) {
    MDBX_txn* txn = nullptr;
    MDBX_txn_flags_t flags = (mode == TxnMode::READ_ONLY) ? MDBX_TXN_RDONLY : MDBX_TXN_READWRITE;
    checkMdbx(mdbx_txn_begin(env_, parent, flags, &txn), "mdbx_txn_begin");
    return txn;
}

void StorageEnvironment::commitTxn(MDBX_txn* txn) {
    // The handle is released whatever the outcome.
    checkMdbx(mdbx_txn_commit(txn), "mdbx_txn_commit");
}

void StorageEnvironment::abortTxn(MDBX_txn* txn) noexcept {
    int rc = mdbx_txn_abort(txn);
    if (rc != MDBX_SUCCESS) {
        LOG_ERROR("[StorageEnvironment] mdbx_txn_abort failed: ", mdbx_strerror(rc));
    }
}

EnvInfo StorageEnvironment::info() const {
    MDBX_envinfo mi;
    checkMdbx(mdbx_env_info_ex(env_, nullptr, &mi, sizeof(mi)), "mdbx_env_info_ex");
    EnvInfo out;
    out.map_size = mi.mi_geo.current;
    out.map_upper = mi.mi_geo.upper;
    out.last_pgno = mi.mi_last_pgno;
    out.recent_txnid = mi.mi_recent_txnid;
    out.max_readers = mi.mi_maxreaders;
    out.num_readers = mi.mi_numreaders;
    out.page_size = mi.mi_dxb_pagesize;
    return out;
}

BucketStat StorageEnvironment::mainStat() const {
    MDBX_stat st;
    checkMdbx(mdbx_env_stat_ex(env_, nullptr, &st, sizeof(st)), "mdbx_env_stat_ex");
    return toBucketStat(st);
}

std::string StorageEnvironment::version() {
    std::ostringstream oss;
    oss << "libmdbx " << static_cast<unsigned>(mdbx_version.major) << "."
        << static_cast<unsigned>(mdbx_version.minor) << "."
        << static_cast<unsigned>(mdbx_version.release);
    return oss.str();
}

} // namespace nestkv
