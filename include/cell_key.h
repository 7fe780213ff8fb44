// @include/cell_key.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <string>
#include <functional>

namespace nestkv {

/**
 * @brief Identity of one cell: (bucket name, raw key bytes).
 *
 * serialize() produces a canonical string used to deduplicate dirty keys;
 * deserialize(serialize(k)) == k for arbitrary binary bucket names and keys.
 */
struct CellKey {
    std::string bucket;
    Bytes key;

    CellKey() = default;
    CellKey(std::string b, Bytes k) : bucket(std::move(b)), key(std::move(k)) {}

    std::string serialize() const;
    static storage::Result<CellKey> deserialize(const std::string& encoded);

    bool operator==(const CellKey& other) const { return bucket == other.bucket && key == other.key; }
    bool operator!=(const CellKey& other) const { return !(*this == other); }
    bool operator<(const CellKey& other) const {
        return bucket != other.bucket ? bucket < other.bucket : key < other.key;
    }
};

struct CellKeyHash {
    size_t operator()(const CellKey& k) const {
        size_t h = std::hash<std::string>{}(k.bucket);
        return h ^ (std::hash<std::string>{}(k.key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

// Lower-case hex, two characters per byte.
std::string toHex(BytesView bytes);
storage::Result<Bytes> fromHex(const std::string& hex);

} // namespace nestkv
