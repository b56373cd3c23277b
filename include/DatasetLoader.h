#pragma once

#include "NetworkRecord.h"

#include <cstddef>
#include <optional>
#include <string>

struct JsonValue;

struct LoadDiagnostic {
    enum class Kind { SOURCE_UNAVAILABLE, MALFORMED_SOURCE };

    Kind kind = Kind::MALFORMED_SOURCE;
    std::string source;
    std::string message;
    // Byte offset of a decode failure, when the parser could locate one.
    std::optional<size_t> offset;

    std::string describe() const;
};

struct LoadResult {
    // Never null; empty when the source was unavailable or malformed.
    NetworkSnapshot records;
    size_t droppedCount = 0;
    std::optional<LoadDiagnostic> diagnostic;

    bool ok() const noexcept { return !diagnostic.has_value(); }
};

/**
 * @brief Turns an already-downloaded PeeringDB `net` dump into NetworkRecords.
 * @details Expects `{"data": [ {...}, ... ]}`. Never throws for bad input: an
 * absent or undecodable source yields an empty collection plus a diagnostic,
 * and records without a usable id are dropped and counted.
 */
class DatasetLoader {
public:
    static LoadResult loadFromBytes(const std::string& bytes, const std::string& sourceLabel = "<memory>");
    static LoadResult loadFromFile(const std::string& path);

    /**
     * @brief Builds one record from a JSON object.
     * @return std::nullopt when the node is not an object or has no integer id.
     */
    static std::optional<NetworkRecord> parseRecord(const JsonValue& node);

    static void setVerbose(bool verbose) noexcept;
};
