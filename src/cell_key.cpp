// @src/cell_key.cpp
#include "../include/cell_key.h"
#include "../include/storage_error/error_utils.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nestkv {

std::string toHex(BytesView bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

namespace {
int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

storage::Result<Bytes> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return STORAGE_ERROR(storage::ErrorCode::ENCODING_ERROR, "Hex string has odd length");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return STORAGE_ERROR(storage::ErrorCode::ENCODING_ERROR, "Invalid hex digit")
                .withContext("offset", std::to_string(i));
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

std::string CellKey::serialize() const {
    json j;
    // Both parts are hex so arbitrary bytes never reach the JSON dumper.
    j["bucket"] = toHex(bucket);
    j["key"] = toHex(key);
    return j.dump();
}

storage::Result<CellKey> CellKey::deserialize(const std::string& encoded) {
    json j;
    try {
        j = json::parse(encoded);
    } catch (const json::parse_error& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Cell key is not valid JSON")
            .withDetails(e.what());
    }
    if (!j.is_object() || !j.contains("bucket") || !j.contains("key") ||
        !j["bucket"].is_string() || !j["key"].is_string()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Cell key needs string fields 'bucket' and 'key'");
    }
    ASSIGN_OR_RETURN_AUTO(bucket, fromHex(j["bucket"].get<std::string>()));
    ASSIGN_OR_RETURN_AUTO(key, fromHex(j["key"].get<std::string>()));
    return CellKey(std::move(bucket), std::move(key));
}

} // namespace nestkv
