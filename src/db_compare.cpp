// @src/db_compare.cpp
#include "../include/db_compare.h"
#include "../include/database.h"
#include "../include/tx_patch.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

namespace nestkv {

TxnPatch makePatchOfDb(Database& db) {
    if (!db.unopenedBuckets().empty()) {
        throw STORAGE_ERROR(storage::ErrorCode::BUCKET_LIMIT_REACHED,
                            "Cannot scan every bucket; some were left unopened by the bucket limit")
            .withContext("unopened", std::to_string(db.unopenedBuckets().size()))
            .withContext("first", format_key_for_print(db.unopenedBuckets().front()))
            .withFilePath(db.path())
            .withSuggestedAction("Reopen the database with a larger bucket limit");
    }
    for (const auto& name : db.getExistingBuckets()) {
        if (!db.hasBucket(name)) {
            LOG_WARN("[makePatchOfDb] '", format_key_for_print(name), "' in '", db.path(),
                     "' is not in the bucket table and is not compared");
        }
    }

    return db.runRead([&db](ReadTransaction& txn) {
        TxnPatch patch;
        for (const auto& bucket : db.buckets()) {
            Cursor* cursor = txn.openCursor(bucket);
            if (!cursor) {
                continue;
            }
            do {
                auto [key, value] = cursor->getNoCopy();
                CellState cell;
                cell.bucket = bucket;
                cell.key = Bytes(key);
                cell.exists = true;
                cell.value = Bytes(value);
                patch.push_back(std::move(cell));
            } while (cursor->next());
            cursor->close();
        }
        return patch;
    });
}

bool isEqualDb(Database& a, Database& b) {
    TxnPatch left = makePatchOfDb(a);
    TxnPatch right = makePatchOfDb(b);
    bool equal = patchesEqual(left, right);
    if (!equal) {
        LOG_DEBUG("[isEqualDb] '", a.path(), "' (", left.size(), " cells) differs from '",
                  b.path(), "' (", right.size(), " cells)");
    }
    return equal;
}

} // namespace nestkv
