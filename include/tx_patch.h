// @include/tx_patch.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <functional>
#include <string>

namespace nestkv {

class Database;
class ReadWriteTransaction;

using TxnBody = std::function<storage::Status(ReadWriteTransaction&)>;

// Runs body in a write transaction that is always rolled back.
// Returns body's own error, or ok.
storage::Status dryRun(Database& db, const TxnBody& body);
storage::Status dryRun(ReadWriteTransaction& parent, const TxnBody& body);

/**
 * @brief Dry-runs body and returns the net effect on every cell it touched.
 *
 * Each touched (bucket, key) appears once, with the value it held when body
 * returned, or exists == false if it was absent then. Nothing persists. If
 * body fails its error is returned and no patch is produced. The result is
 * sorted by (bucket, key).
 */
storage::Result<TxnPatch> makePatch(Database& db, const TxnBody& body);
storage::Result<TxnPatch> makePatch(ReadWriteTransaction& parent, const TxnBody& body);

// Runs body and commits its writes, returning every touched cell with its
// value before and after body. inversePatch of the result undoes the change.
// If body fails nothing is written and its error is returned.
storage::Result<TxnDePatch> makeDePatch(Database& db, const TxnBody& body);
storage::Result<TxnDePatch> makeDePatch(ReadWriteTransaction& parent, const TxnBody& body);

TxnPatch forwardPatch(const TxnDePatch& de_patch);
// Applying the inverse after the forward patch restores the original cells.
TxnPatch inversePatch(const TxnDePatch& de_patch);

// Put for existing cells, Delete otherwise, inside txn. Idempotent.
void applyPatch(ReadWriteTransaction& txn, const TxnPatch& patch);

// Set comparison keyed by (bucket, key); values compared only for existing cells.
bool patchesEqual(const TxnPatch& a, const TxnPatch& b);

void sortPatch(TxnPatch& patch);

// Portable form: {"version":1,"cells":[...],"crc32":n}; bucket names, keys
// and values are hex.
std::string patchToJson(const TxnPatch& patch);
storage::Result<TxnPatch> patchFromJson(const std::string& json_text);

} // namespace nestkv
