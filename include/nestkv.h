// @include/nestkv.h
#pragma once

#include "types.h"
#include "options.h"
#include "cell_key.h"
#include "cursor.h"
#include "transaction.h"
#include "database.h"
#include "write_batch.h"
#include "tx_patch.h"
#include "db_compare.h"
#include "storage_error/error_utils.h"
