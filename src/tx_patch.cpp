// @src/tx_patch.cpp
#include "../include/tx_patch.h"
#include "../include/database.h"
#include "../include/cell_key.h"
#include "../include/debug_utils.h"
#include "../include/storage_error/error_utils.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <set>

using json = nlohmann::json;

namespace nestkv {

namespace {

constexpr int PATCH_FORMAT_VERSION = 1;

// Returned from a dry-run body so the runner aborts. Never leaves this file.
storage::StorageError dryRunSentinel() {
    return storage::StorageError(storage::ErrorCode::TXN_DRY_RUN, "dry run rollback");
}

TxnPatch collectCells(ReadWriteTransaction& txn) {
    TxnPatch patch;
    const DirtyKeySet* dirty = txn.dirtyKeys();
    if (!dirty) {
        return patch;
    }
    for (const auto& cell_key : dirty->keys()) {
        CellState cell;
        cell.bucket = cell_key.bucket;
        cell.key = cell_key.key;
        auto value = txn.get(cell_key.bucket, cell_key.key);
        cell.exists = value.has_value();
        if (value) {
            cell.value = std::move(*value);
        }
        patch.push_back(std::move(cell));
    }
    return patch;
}

storage::Status runDry(Database& db, ReadTransaction* parent, const TxnBody& body) {
    bool completed = false;
    storage::Status status = db.runWrite(parent, [&](ReadWriteTransaction& txn) -> storage::Status {
        RETURN_IF_ERROR(body(txn));
        completed = true;
        return dryRunSentinel();
    });
    if (completed) {
        return storage::OkStatus();
    }
    return status;
}

storage::Result<TxnPatch> recordPatch(Database& db, ReadTransaction* parent, const TxnBody& body) {
    TxnPatch patch;
    bool completed = false;
    storage::Status status = db.runRecordingWrite(parent, [&](ReadWriteTransaction& txn) -> storage::Status {
        RETURN_IF_ERROR(body(txn));
        patch = collectCells(txn);
        completed = true;
        return dryRunSentinel();
    });
    if (completed) {
        LOG_DEBUG("[makePatch] Captured ", patch.size(), " cell(s)");
        return patch;
    }
    return std::move(status).error();
}

storage::Result<TxnDePatch> recordDePatch(Database& db, ReadTransaction* parent, const TxnBody& body) {
    TxnDePatch de_patch;
    storage::Status status = db.runWrite(parent, [&](ReadWriteTransaction& outer) -> storage::Status {
        // body runs one level down in a recording child that is rolled back,
        // so the outer transaction still shows the pre-images.
        TxnPatch after;
        bool body_done = false;
        storage::Status inner = db.runRecordingWrite(&outer, [&](ReadWriteTransaction& child) -> storage::Status {
            RETURN_IF_ERROR(body(child));
            after = collectCells(child);
            body_done = true;
            return dryRunSentinel();
        });
        if (!body_done) {
            return inner;
        }

        de_patch.reserve(after.size());
        for (auto& cell : after) {
            DeCellState entry;
            auto before = outer.get(cell.bucket, cell.key);
            entry.existed_before = before.has_value();
            if (before) {
                entry.value_before = std::move(*before);
            }
            entry.after = std::move(cell);
            de_patch.push_back(std::move(entry));
        }

        // The net effect of body is exactly the post-images; commit them.
        outer.applyPatch(forwardPatch(de_patch));
        return storage::OkStatus();
    });
    if (!status.isOk()) {
        return std::move(status).error();
    }
    LOG_DEBUG("[makeDePatch] Committed ", de_patch.size(), " cell(s)");
    return de_patch;
}

} // namespace

storage::Status dryRun(Database& db, const TxnBody& body) {
    return runDry(db, nullptr, body);
}

storage::Status dryRun(ReadWriteTransaction& parent, const TxnBody& body) {
    return runDry(parent.database(), &parent, body);
}

storage::Result<TxnPatch> makePatch(Database& db, const TxnBody& body) {
    return recordPatch(db, nullptr, body);
}

storage::Result<TxnPatch> makePatch(ReadWriteTransaction& parent, const TxnBody& body) {
    return recordPatch(parent.database(), &parent, body);
}

storage::Result<TxnDePatch> makeDePatch(Database& db, const TxnBody& body) {
    return recordDePatch(db, nullptr, body);
}

storage::Result<TxnDePatch> makeDePatch(ReadWriteTransaction& parent, const TxnBody& body) {
    return recordDePatch(parent.database(), &parent, body);
}

TxnPatch forwardPatch(const TxnDePatch& de_patch) {
    TxnPatch out;
    out.reserve(de_patch.size());
    for (const auto& entry : de_patch) {
        out.push_back(entry.after);
    }
    return out;
}

TxnPatch inversePatch(const TxnDePatch& de_patch) {
    TxnPatch out;
    out.reserve(de_patch.size());
    for (const auto& entry : de_patch) {
        CellState cell;
        cell.bucket = entry.after.bucket;
        cell.key = entry.after.key;
        cell.exists = entry.existed_before;
        cell.value = entry.value_before;
        out.push_back(std::move(cell));
    }
    return out;
}

void applyPatch(ReadWriteTransaction& txn, const TxnPatch& patch) {
    txn.applyPatch(patch);
}

bool patchesEqual(const TxnPatch& a, const TxnPatch& b) {
    if (a.size() != b.size()) {
        return false;
    }
    std::map<CellKey, const CellState*> index;
    for (const auto& cell : a) {
        if (!index.emplace(CellKey(cell.bucket, cell.key), &cell).second) {
            return false; // duplicate cell; not a valid patch
        }
    }
    std::set<CellKey> seen;
    for (const auto& cell : b) {
        CellKey key(cell.bucket, cell.key);
        auto it = index.find(key);
        if (it == index.end() || !seen.insert(key).second) {
            return false;
        }
        const CellState& other = *it->second;
        if (other.exists != cell.exists) {
            return false;
        }
        if (cell.exists && other.value != cell.value) {
            return false;
        }
    }
    return true;
}

void sortPatch(TxnPatch& patch) {
    std::sort(patch.begin(), patch.end(), [](const CellState& l, const CellState& r) {
        return l.bucket != r.bucket ? l.bucket < r.bucket : l.key < r.key;
    });
}

std::string patchToJson(const TxnPatch& patch) {
    json cells = json::array();
    for (const auto& cell : patch) {
        json c;
        c["bucket"] = toHex(cell.bucket);
        c["key"] = toHex(cell.key);
        c["exists"] = cell.exists;
        c["value"] = cell.exists ? toHex(cell.value) : std::string();
        cells.push_back(std::move(c));
    }
    json j;
    j["version"] = PATCH_FORMAT_VERSION;
    j["crc32"] = calculate_checksum(cells.dump());
    j["cells"] = std::move(cells);
    return j.dump();
}

storage::Result<TxnPatch> patchFromJson(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Patch is not valid JSON")
            .withDetails(e.what());
    }
    if (!j.is_object() || !j.contains("cells") || !j["cells"].is_array()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Patch needs a 'cells' array");
    }
    if (j.value("version", 0) != PATCH_FORMAT_VERSION) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Unsupported patch version")
            .withContext("version", j.contains("version") ? j["version"].dump() : "missing");
    }
    if (!j.contains("crc32") || !j["crc32"].is_number_unsigned()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Patch has no checksum");
    }
    uint32_t expected = j["crc32"].get<uint32_t>();
    uint32_t actual = calculate_checksum(j["cells"].dump());
    if (expected != actual) {
        return STORAGE_ERROR(storage::ErrorCode::CHECKSUM_MISMATCH, "Patch checksum mismatch")
            .withContext("expected", std::to_string(expected))
            .withContext("actual", std::to_string(actual));
    }

    TxnPatch patch;
    std::set<CellKey> seen;
    for (const auto& c : j["cells"]) {
        if (!c.is_object() || !c.contains("bucket") || !c["bucket"].is_string() ||
            !c.contains("key") || !c["key"].is_string() ||
            !c.contains("exists") || !c["exists"].is_boolean()) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Malformed patch cell");
        }
        CellState cell;
        ASSIGN_OR_RETURN(cell.bucket, fromHex(c["bucket"].get<std::string>()));
        if (cell.bucket.empty()) {
            return STORAGE_ERROR(storage::ErrorCode::BUCKET_NAME_EMPTY, "Patch cell has an empty bucket name");
        }
        ASSIGN_OR_RETURN(cell.key, fromHex(c["key"].get<std::string>()));
        cell.exists = c["exists"].get<bool>();
        if (cell.exists) {
            ASSIGN_OR_RETURN(cell.value, fromHex(c.value("value", std::string())));
        }
        if (!seen.insert(CellKey(cell.bucket, cell.key)).second) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Patch repeats a cell")
                .withContext("bucket", format_key_for_print(cell.bucket))
                .withContext("key", format_key_for_print(cell.key));
        }
        patch.push_back(std::move(cell));
    }
    return patch;
}

} // namespace nestkv
