// @include/cursor.h
#pragma once

#include "types.h"

#include <mdbx.h>

#include <string>
#include <utility>

namespace nestkv {

class ReadTransaction;
class ReadWriteTransaction;

/**
 * @brief Ordered position inside one bucket, scoped to one transaction.
 *
 * Obtained from ReadTransaction::openCursor and owned by that transaction.
 * next()/previous() return false at the ends and leave the cursor on the
 * boundary entry. On an unpositioned cursor they start from the first/last
 * entry.
 */
class Cursor {
public:
    enum class State {
        UNPOSITIONED,
        POSITIONED,
        CLOSED
    };

    ~Cursor();

    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    bool seekFirst();
    bool seekLast();
    bool next();
    bool previous();
    bool seekExact(BytesView key);
    bool seekGE(BytesView key);
    bool seekByPrefix(BytesView prefix);

    // Throws CURSOR_NOT_POSITIONED / CURSOR_CLOSED.
    KeyValue get() const;
    std::pair<BytesView, BytesView> getNoCopy() const;

    // Write transactions only.
    void put(BytesView value);                 // overwrite the current cell
    void put(BytesView key, BytesView value);  // upsert, then position on key
    void remove();                             // delete the current cell

    void close() noexcept;

    State state() const { return state_; }
    bool isPositioned() const { return state_ == State::POSITIONED; }
    bool isClosed() const { return state_ == State::CLOSED; }
    const std::string& bucket() const { return bucket_; }

private:
    friend class ReadTransaction;

    Cursor(ReadTransaction& owner, std::string bucket, MDBX_cursor* cursor);

    bool position(MDBX_cursor_op op, BytesView key, MDBX_val* found_key = nullptr);
    void checkOpen() const;
    void checkPositioned() const;
    ReadWriteTransaction& writableOwner() const;

    ReadTransaction& owner_;
    std::string bucket_;
    MDBX_cursor* cursor_;
    State state_ = State::UNPOSITIONED;
    bool after_delete_ = false;
};

} // namespace nestkv
