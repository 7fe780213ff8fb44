// @include/types.h

#pragma once
#include <zlib.h>

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <utility>

namespace nestkv {

// --- Foundational Data Types ---
using Bytes = std::string;          // raw key/value bytes
using BytesView = std::string_view; // borrowed bytes, valid while the owning txn lives

using TxnId = uint64_t;
static constexpr TxnId INVALID_TXN_ID = 0;

static constexpr uint64_t MAP_SIZE_DEFAULT = 1ULL << 40; // 1 TiB
static constexpr unsigned MAX_BUCKETS_DEFAULT = 32;
static constexpr unsigned MAX_READERS_DEFAULT = 126;
static constexpr unsigned FILE_MODE_DEFAULT = 0664;

enum class TxnMode : uint8_t {
    READ_ONLY,
    READ_WRITE
};

enum class TxnState : uint8_t {
    ACTIVE,
    COMMITTED,
    ABORTED
};

struct KeyValue {
    Bytes key;
    Bytes value;

    bool operator==(const KeyValue& other) const {
        return key == other.key && value == other.value;
    }
};

/**
 * @brief Net effect of a transaction on one cell.
 * exists == false models a deletion, or a key that never existed.
 */
struct CellState {
    std::string bucket;
    Bytes key;
    bool exists = false;
    Bytes value;

    bool operator==(const CellState& other) const {
        return bucket == other.bucket && key == other.key &&
               exists == other.exists && (!exists || value == other.value);
    }
    bool operator!=(const CellState& other) const { return !(*this == other); }
};

// One entry per (bucket, key). Order carries no meaning.
using TxnPatch = std::vector<CellState>;

/**
 * @brief Cell state with its pre-image, for building inverse patches.
 */
struct DeCellState {
    CellState after;
    bool existed_before = false;
    Bytes value_before;
};

using TxnDePatch = std::vector<DeCellState>;

// Per-bucket b-tree statistics.
struct BucketStat {
    uint32_t page_size = 0;
    uint32_t depth = 0;
    uint64_t branch_pages = 0;
    uint64_t leaf_pages = 0;
    uint64_t overflow_pages = 0;
    uint64_t entries = 0;
};

struct EnvStat {
    BucketStat main;       // the metadata tree that lists bucket names
    uint32_t bucket_count = 0;
    uint64_t total_entries = 0;
};

struct EnvInfo {
    uint64_t map_size = 0;
    uint64_t map_upper = 0;
    uint64_t last_pgno = 0;
    uint64_t recent_txnid = 0;
    uint32_t max_readers = 0;
    uint32_t num_readers = 0;
    uint32_t page_size = 0;

    uint64_t usedBytes() const { return (last_pgno + 1) * page_size; }
};

inline uint32_t calculate_checksum(std::string_view data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (data.empty()) {
        return static_cast<uint32_t>(crc);
    }
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

} // namespace nestkv
