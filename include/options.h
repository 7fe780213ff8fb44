// @include/options.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <string>
#include <vector>

namespace nestkv {

/**
 * @brief Parameters for opening a Database.
 *
 * The effective bucket limit is max(max_buckets, buckets.size()).
 */
struct DatabaseOptions {
    std::string path;
    std::vector<std::string> buckets;
    uint64_t map_size = MAP_SIZE_DEFAULT;
    unsigned max_buckets = MAX_BUCKETS_DEFAULT;
    unsigned max_readers = MAX_READERS_DEFAULT;
    unsigned file_mode = FILE_MODE_DEFAULT;
    bool no_subdir = false;     // path names the data file, not a directory
    bool create_if_missing = true;

    unsigned effectiveMaxBuckets() const;

    storage::Status validate() const;
    std::string toJson() const;

    // Missing keys keep their defaults.
    static storage::Result<DatabaseOptions> fromJson(const std::string& json_text);
    static storage::Result<DatabaseOptions> fromJsonFile(const std::string& file_path);
};

} // namespace nestkv
