#include "DatasetLoader.h"

#include "JsonUtils.h"
#include "NetVizExceptions.h"

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace {
std::atomic<bool> gVerbose{false};

std::optional<std::string> readString(const JsonValue& object, const char* key) {
    const JsonValue* node = object.find(key);
    if (node == nullptr || !node->isString()) return std::nullopt;
    return node->stringValue;
}

std::optional<int64_t> readInteger(const JsonValue& object, const char* key) {
    const JsonValue* node = object.find(key);
    if (node == nullptr || !node->isInteger()) return std::nullopt;
    return node->integerValue;
}

LoadResult emptyResult(LoadDiagnostic diagnostic) {
    LoadResult result;
    result.records = std::make_shared<const NetworkCollection>();
    result.diagnostic = std::move(diagnostic);
    std::cerr << "[NetViz][Loader] " << result.diagnostic->describe() << "\n";
    return result;
}

LoadDiagnostic makeDiagnostic(LoadDiagnostic::Kind kind,
                              const std::string& source,
                              const std::string& message,
                              std::optional<size_t> offset = std::nullopt) {
    LoadDiagnostic diagnostic;
    diagnostic.kind = kind;
    diagnostic.source = source;
    diagnostic.message = message;
    diagnostic.offset = offset;
    return diagnostic;
}

std::string readWholeFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw NetViz::IOException("Could not open file " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw NetViz::IOException("Failed while reading " + path);
    }
    return buffer.str();
}
} // namespace

std::string LoadDiagnostic::describe() const {
    std::ostringstream out;
    out << (kind == Kind::SOURCE_UNAVAILABLE ? "source unavailable" : "malformed source")
        << " (" << source << "): " << message;
    if (offset) {
        out << " [offset " << *offset << "]";
    }
    return out.str();
}

void DatasetLoader::setVerbose(bool verbose) noexcept {
    gVerbose.store(verbose, std::memory_order_relaxed);
}

std::optional<NetworkRecord> DatasetLoader::parseRecord(const JsonValue& node) {
    if (!node.isObject()) return std::nullopt;

    const std::optional<int64_t> id = readInteger(node, "id");
    if (!id) return std::nullopt;

    NetworkRecord record;
    record.id = *id;
    record.name = readString(node, "name");
    record.aka = readString(node, "aka");
    record.asn = readInteger(node, "asn");
    record.status = readString(node, "status");
    record.infoType = readString(node, "info_type");
    record.policyGeneral = readString(node, "policy_general");
    record.infoScope = readString(node, "info_scope");
    record.infoPrefixes4 = readInteger(node, "info_prefixes4");
    record.infoPrefixes6 = readInteger(node, "info_prefixes6");
    record.ixCount = readInteger(node, "ix_count");
    record.facCount = readInteger(node, "fac_count");
    record.website = readString(node, "website");
    return record;
}

LoadResult DatasetLoader::loadFromBytes(const std::string& bytes, const std::string& sourceLabel) {
    JsonValue root;
    try {
        root = JsonUtils::parse(bytes);
    } catch (const NetViz::JsonParseException& e) {
        return emptyResult(makeDiagnostic(LoadDiagnostic::Kind::MALFORMED_SOURCE,
                                          sourceLabel,
                                          e.detail(),
                                          e.offset()));
    }

    const JsonValue* dataNode = root.find("data");
    if (!root.isObject() || dataNode == nullptr || !dataNode->isArray()) {
        return emptyResult(makeDiagnostic(LoadDiagnostic::Kind::MALFORMED_SOURCE,
                                          sourceLabel,
                                          "Expected a top-level object with a 'data' array"));
    }

    auto records = std::make_shared<NetworkCollection>();
    records->reserve(dataNode->arrayValue.size());
    std::unordered_set<int64_t> seenIds;
    size_t missingId = 0;
    size_t duplicateId = 0;

    for (const auto& item : dataNode->arrayValue) {
        std::optional<NetworkRecord> record = parseRecord(item);
        if (!record) {
            ++missingId;
            if (gVerbose.load(std::memory_order_relaxed)) {
                std::cerr << "[NetViz][Loader] record without usable id dropped: " << item.dump() << "\n";
            }
            continue;
        }
        if (!seenIds.insert(record->id).second) {
            ++duplicateId;
            if (gVerbose.load(std::memory_order_relaxed)) {
                std::cerr << "[NetViz][Loader] duplicate id=" << record->id << " dropped\n";
            }
            continue;
        }
        records->push_back(std::move(*record));
    }

    LoadResult result;
    result.droppedCount = missingId + duplicateId;
    if (result.droppedCount > 0) {
        std::cerr << "[NetViz][Loader] Warning: dropped " << result.droppedCount << " record(s) from "
                  << sourceLabel << " (missing id: " << missingId << ", duplicate id: " << duplicateId << ")\n";
    }
    std::cout << "[NetViz][Loader] Loaded " << records->size() << " network(s) from " << sourceLabel << "\n";

    result.records = std::move(records);
    return result;
}

LoadResult DatasetLoader::loadFromFile(const std::string& path) {
    std::string bytes;
    try {
        bytes = readWholeFile(path);
    } catch (const NetViz::IOException& e) {
        return emptyResult(makeDiagnostic(LoadDiagnostic::Kind::SOURCE_UNAVAILABLE, path, e.what()));
    }
    return loadFromBytes(bytes, path);
}
