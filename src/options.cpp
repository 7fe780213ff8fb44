// @src/options.cpp
#include "../include/options.h"
#include "../include/storage_error/error_utils.h"
#include "../include/debug_utils.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace nestkv {

unsigned DatabaseOptions::effectiveMaxBuckets() const {
    return std::max<unsigned>(max_buckets, static_cast<unsigned>(buckets.size()));
}

storage::Status DatabaseOptions::validate() const {
    if (path.empty()) {
        return STORAGE_ERROR(storage::ErrorCode::MISSING_REQUIRED_OPTION, "Database path is empty");
    }
    for (const auto& name : buckets) {
        if (name.empty()) {
            return STORAGE_ERROR(storage::ErrorCode::BUCKET_NAME_EMPTY, "Bucket name is empty")
                .withFilePath(path);
        }
    }
    if (map_size == 0) {
        return STORAGE_ERROR(storage::ErrorCode::OPTION_OUT_OF_RANGE, "map_size must be positive");
    }
    // The engine takes the size as intptr_t and treats negatives as "default".
    if (map_size > static_cast<uint64_t>(INTPTR_MAX)) {
        return STORAGE_ERROR(storage::ErrorCode::OPTION_OUT_OF_RANGE, "map_size does not fit the address space")
            .withContext("map_size", std::to_string(map_size))
            .withContext("limit", std::to_string(static_cast<uint64_t>(INTPTR_MAX)));
    }
    if (max_readers == 0) {
        return STORAGE_ERROR(storage::ErrorCode::OPTION_OUT_OF_RANGE, "max_readers must be positive");
    }
    return storage::OkStatus();
}

std::string DatabaseOptions::toJson() const {
    json j;
    j["path"] = path;
    j["buckets"] = buckets;
    j["map_size"] = map_size;
    j["max_buckets"] = max_buckets;
    j["max_readers"] = max_readers;
    j["file_mode"] = file_mode;
    j["no_subdir"] = no_subdir;
    j["create_if_missing"] = create_if_missing;
    return j.dump(2);
}

storage::Result<DatabaseOptions> DatabaseOptions::fromJson(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Options are not valid JSON")
            .withDetails(e.what());
    }
    if (!j.is_object()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Options must be a JSON object");
    }

    DatabaseOptions opts;
    try {
        opts.path = j.value("path", opts.path);
        opts.buckets = j.value("buckets", opts.buckets);
        opts.map_size = j.value("map_size", opts.map_size);
        opts.max_buckets = j.value("max_buckets", opts.max_buckets);
        opts.max_readers = j.value("max_readers", opts.max_readers);
        opts.file_mode = j.value("file_mode", opts.file_mode);
        opts.no_subdir = j.value("no_subdir", opts.no_subdir);
        opts.create_if_missing = j.value("create_if_missing", opts.create_if_missing);
    } catch (const json::type_error& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Option has the wrong type")
            .withDetails(e.what());
    }
    return opts;
}

storage::Result<DatabaseOptions> DatabaseOptions::fromJsonFile(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        return STORAGE_ERROR(storage::ErrorCode::FILE_NOT_FOUND, "Cannot read options file")
            .withFilePath(file_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto result = fromJson(buffer.str());
    if (!result.isOk()) {
        LOG_WARN("[DatabaseOptions] Failed to load ", file_path, ": ", result.error().message);
        return std::move(result).mapError([&](storage::StorageError err) {
            return std::move(err.withFilePath(file_path));
        });
    }
    return result;
}

} // namespace nestkv
