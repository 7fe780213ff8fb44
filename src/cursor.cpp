// @src/cursor.cpp
#include "../include/cursor.h"
#include "../include/transaction.h"
#include "../include/environment.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

namespace nestkv {

namespace {
inline BytesView toView(const MDBX_val& v) {
    return BytesView(static_cast<const char*>(v.iov_base), v.iov_len);
}
inline MDBX_val toVal(BytesView b) {
    return MDBX_val{const_cast<char*>(b.data()), b.size()};
}
} // namespace

Cursor::Cursor(ReadTransaction& owner, std::string bucket, MDBX_cursor* cursor)
    : owner_(owner), bucket_(std::move(bucket)), cursor_(cursor) {}

Cursor::~Cursor() {
    close();
}

void Cursor::close() noexcept {
    if (cursor_) {
        mdbx_cursor_close(cursor_);
        cursor_ = nullptr;
    }
    state_ = State::CLOSED;
}

void Cursor::checkOpen() const {
    if (state_ == State::CLOSED) {
        throw storage::StorageError::usage(storage::ErrorCode::CURSOR_CLOSED, "Cursor is closed")
            .withContext("bucket", bucket_);
    }
    owner_.checkUsable();
}

void Cursor::checkPositioned() const {
    checkOpen();
    if (state_ != State::POSITIONED) {
        throw storage::StorageError::usage(storage::ErrorCode::CURSOR_NOT_POSITIONED,
            "Cursor is not positioned on an entry")
            .withContext("bucket", bucket_);
    }
}

ReadWriteTransaction& Cursor::writableOwner() const {
    if (owner_.mode() != TxnMode::READ_WRITE) {
        throw storage::StorageError::usage(storage::ErrorCode::TXN_READ_ONLY,
            "Cursor mutation inside a read transaction")
            .withContext("bucket", bucket_);
    }
    return static_cast<ReadWriteTransaction&>(owner_);
}

bool Cursor::position(MDBX_cursor_op op, BytesView key, MDBX_val* found_key) {
    checkOpen();
    MDBX_val k = toVal(key);
    MDBX_val v{nullptr, 0};
    int rc = mdbx_cursor_get(cursor_, &k, &v, op);
    if (rc == MDBX_NOTFOUND) {
        state_ = State::UNPOSITIONED;
        after_delete_ = false;
        return false;
    }
    checkMdbx(rc, "mdbx_cursor_get");
    if (found_key) {
        *found_key = k;
    }
    state_ = State::POSITIONED;
    after_delete_ = false;
    return true;
}

bool Cursor::seekFirst() {
    return position(MDBX_FIRST, BytesView());
}

bool Cursor::seekLast() {
    return position(MDBX_LAST, BytesView());
}

bool Cursor::next() {
    checkOpen();
    if (state_ != State::POSITIONED && !after_delete_) {
        return seekFirst();
    }
    if (position(MDBX_NEXT, BytesView())) {
        return true;
    }
    // Past the end: stay on the last entry.
    seekLast();
    return false;
}

bool Cursor::previous() {
    checkOpen();
    if (state_ != State::POSITIONED && !after_delete_) {
        return seekLast();
    }
    if (position(MDBX_PREV, BytesView())) {
        return true;
    }
    seekFirst();
    return false;
}

bool Cursor::seekExact(BytesView key) {
    return position(MDBX_SET_KEY, key);
}

bool Cursor::seekGE(BytesView key) {
    return position(MDBX_SET_RANGE, key);
}

bool Cursor::seekByPrefix(BytesView prefix) {
    MDBX_val found{nullptr, 0};
    if (!position(MDBX_SET_RANGE, prefix, &found)) {
        return false;
    }
    BytesView key = toView(found);
    if (key.size() < prefix.size() || key.substr(0, prefix.size()) != prefix) {
        state_ = State::UNPOSITIONED;
        return false;
    }
    return true;
}

std::pair<BytesView, BytesView> Cursor::getNoCopy() const {
    checkPositioned();
    MDBX_val k{nullptr, 0};
    MDBX_val v{nullptr, 0};
    checkMdbx(mdbx_cursor_get(cursor_, &k, &v, MDBX_GET_CURRENT), "mdbx_cursor_get");
    return {toView(k), toView(v)};
}

KeyValue Cursor::get() const {
    auto [k, v] = getNoCopy();
    return KeyValue{Bytes(k), Bytes(v)};
}

void Cursor::put(BytesView value) {
    ReadWriteTransaction& txn = writableOwner();
    // Copy the key out of the page before the write touches it.
    Bytes key(getNoCopy().first);
    MDBX_val k = toVal(key);
    MDBX_val v = toVal(value);
    checkMdbx(mdbx_cursor_put(cursor_, &k, &v, MDBX_CURRENT), "mdbx_cursor_put");
    txn.markDirty(bucket_, key);
}

void Cursor::put(BytesView key, BytesView value) {
    ReadWriteTransaction& txn = writableOwner();
    checkOpen();
    MDBX_val k = toVal(key);
    MDBX_val v = toVal(value);
    checkMdbx(mdbx_cursor_put(cursor_, &k, &v, MDBX_UPSERT), "mdbx_cursor_put");
    txn.markDirty(bucket_, key);
    state_ = State::POSITIONED;
    after_delete_ = false;
}

void Cursor::remove() {
    ReadWriteTransaction& txn = writableOwner();
    Bytes key(getNoCopy().first);
    checkMdbx(mdbx_cursor_del(cursor_, MDBX_CURRENT), "mdbx_cursor_del");
    txn.markDirty(bucket_, key);
    // The engine keeps its place; next()/previous() continue from there.
    state_ = State::UNPOSITIONED;
    after_delete_ = true;
    LOG_TRACE("[Cursor] Removed '", format_key_for_print(key), "' from bucket '", bucket_, "'");
}

} // namespace nestkv
