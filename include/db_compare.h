// @include/db_compare.h
#pragma once

#include "types.h"

namespace nestkv {

class Database;

// Every cell of every bucket in db as one patch (exists == true), read in a
// single read transaction. Sorted by (bucket, key). Throws
// BUCKET_LIMIT_REACHED if the file holds buckets that open() could not fit.
TxnPatch makePatchOfDb(Database& db);

// True iff both databases hold the same cells with the same values.
bool isEqualDb(Database& a, Database& b);

} // namespace nestkv
