// @include/write_batch.h
#pragma once

#include "types.h"
#include "cell_key.h"

#include <map>
#include <string>

namespace nestkv {

/**
 * @brief Buffered Put/Delete operations, committed by Database::write in
 * one write transaction. Later operations on the same cell replace earlier
 * ones, so the batch is always a valid patch.
 */
class WriteBatch {
public:
    void put(const std::string& bucket, BytesView key, BytesView value);
    void del(const std::string& bucket, BytesView key);
    void clear() { cells_.clear(); }

    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    TxnPatch patch() const;

private:
    std::map<CellKey, CellState> cells_;
};

} // namespace nestkv
