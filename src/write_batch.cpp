// @src/write_batch.cpp
#include "../include/write_batch.h"

namespace nestkv {

void WriteBatch::put(const std::string& bucket, BytesView key, BytesView value) {
    CellState& cell = cells_[CellKey(bucket, Bytes(key))];
    cell.bucket = bucket;
    cell.key = Bytes(key);
    cell.exists = true;
    cell.value = Bytes(value);
}

void WriteBatch::del(const std::string& bucket, BytesView key) {
    CellState& cell = cells_[CellKey(bucket, Bytes(key))];
    cell.bucket = bucket;
    cell.key = Bytes(key);
    cell.exists = false;
    cell.value.clear();
}

TxnPatch WriteBatch::patch() const {
    TxnPatch out;
    out.reserve(cells_.size());
    for (const auto& [key, cell] : cells_) {
        out.push_back(cell);
    }
    return out;
}

} // namespace nestkv
