#include <gtest/gtest.h>

#include "DatasetLoader.h"
#include "JsonUtils.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class DatasetLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("netviz_loader_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const fs::path path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    fs::path dir;
};

// ============================================================================
// WELL-FORMED SOURCES
// ============================================================================

TEST_F(DatasetLoaderTest, LoadFromBytes_FullRecord_MapsEveryField) {
    const std::string bytes = R"({"data": [{
        "id": 1, "name": "Example Net", "aka": "ExNet", "asn": 64512, "status": "ok",
        "info_type": "Content", "policy_general": "Open", "info_scope": "Global",
        "info_prefixes4": 120, "info_prefixes6": 8, "ix_count": 14, "fac_count": 3,
        "website": "https://example.net"
    }]})";

    const LoadResult result = DatasetLoader::loadFromBytes(bytes);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.records->size(), 1u);
    EXPECT_EQ(result.droppedCount, 0u);
    const NetworkRecord& r = result.records->front();
    EXPECT_EQ(r.id, 1);
    EXPECT_EQ(r.name, "Example Net");
    EXPECT_EQ(r.aka, "ExNet");
    EXPECT_EQ(r.asn, 64512);
    EXPECT_EQ(r.status, "ok");
    EXPECT_EQ(r.infoType, "Content");
    EXPECT_EQ(r.policyGeneral, "Open");
    EXPECT_EQ(r.infoScope, "Global");
    EXPECT_EQ(r.infoPrefixes4, 120);
    EXPECT_EQ(r.infoPrefixes6, 8);
    EXPECT_EQ(r.ixCount, 14);
    EXPECT_EQ(r.facCount, 3);
    EXPECT_EQ(r.website, "https://example.net");
}

TEST_F(DatasetLoaderTest, LoadFromBytes_NullAndMissingFields_StayAbsent) {
    const LoadResult result = DatasetLoader::loadFromBytes(
        R"({"data": [{"id": 2, "name": null, "info_type": "", "ix_count": 0}]})");

    ASSERT_EQ(result.records->size(), 1u);
    const NetworkRecord& r = result.records->front();
    EXPECT_FALSE(r.name.has_value());
    EXPECT_FALSE(r.asn.has_value());
    EXPECT_FALSE(r.facCount.has_value());
    // Zero and empty are values, not absence.
    EXPECT_EQ(r.infoType, "");
    EXPECT_EQ(r.ixCount, 0);
}

TEST_F(DatasetLoaderTest, LoadFromBytes_WrongFieldType_TreatedAsAbsent) {
    const LoadResult result = DatasetLoader::loadFromBytes(
        R"({"data": [{"id": 3, "asn": "64512", "ix_count": 2.5, "name": 42}]})");

    ASSERT_EQ(result.records->size(), 1u);
    EXPECT_FALSE(result.records->front().asn.has_value());
    EXPECT_FALSE(result.records->front().ixCount.has_value());
    EXPECT_FALSE(result.records->front().name.has_value());
}

TEST_F(DatasetLoaderTest, LoadFromBytes_PreservesSourceOrder) {
    const LoadResult result = DatasetLoader::loadFromBytes(R"({"data": [{"id": 30}, {"id": 10}, {"id": 20}]})");
    ASSERT_EQ(result.records->size(), 3u);
    EXPECT_EQ((*result.records)[0].id, 30);
    EXPECT_EQ((*result.records)[1].id, 10);
    EXPECT_EQ((*result.records)[2].id, 20);
}

// ============================================================================
// INVALID RECORDS
// ============================================================================

TEST_F(DatasetLoaderTest, LoadFromBytes_RecordsWithoutId_DroppedAndCounted) {
    const LoadResult result = DatasetLoader::loadFromBytes(
        R"({"data": [{"id": 1}, {"name": "no id"}, {"id": "7"}, 5, {"id": null}, {"id": 2}]})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.records->size(), 2u);
    EXPECT_EQ(result.droppedCount, 4u);
}

TEST_F(DatasetLoaderTest, LoadFromBytes_DuplicateId_KeepsFirstOccurrence) {
    const LoadResult result = DatasetLoader::loadFromBytes(
        R"({"data": [{"id": 1, "name": "first"}, {"id": 1, "name": "second"}]})");

    ASSERT_EQ(result.records->size(), 1u);
    EXPECT_EQ(result.records->front().name, "first");
    EXPECT_EQ(result.droppedCount, 1u);
}

TEST_F(DatasetLoaderTest, ParseRecord_NonObject_ReturnsNullopt) {
    EXPECT_FALSE(DatasetLoader::parseRecord(JsonUtils::parse("[1, 2]")).has_value());
    EXPECT_TRUE(DatasetLoader::parseRecord(JsonUtils::parse(R"({"id": 9})")).has_value());
}

// ============================================================================
// SOURCE-LEVEL FAILURES
// ============================================================================

TEST_F(DatasetLoaderTest, LoadFromBytes_InvalidJson_EmptyWithOffsetDiagnostic) {
    LoadResult result;
    ASSERT_NO_THROW(result = DatasetLoader::loadFromBytes("{\"data\": [ {\"id\": 1,, ] }", "broken.json"));

    ASSERT_NE(result.records, nullptr);
    EXPECT_TRUE(result.records->empty());
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_EQ(result.diagnostic->kind, LoadDiagnostic::Kind::MALFORMED_SOURCE);
    EXPECT_EQ(result.diagnostic->source, "broken.json");
    ASSERT_TRUE(result.diagnostic->offset.has_value());
    EXPECT_EQ(*result.diagnostic->offset, 20u);
    EXPECT_NE(result.diagnostic->describe().find("offset 20"), std::string::npos);
}

TEST_F(DatasetLoaderTest, LoadFromBytes_NotJsonAtAll_EmptyWithDiagnostic) {
    const LoadResult result = DatasetLoader::loadFromBytes("this is not json");
    EXPECT_TRUE(result.records->empty());
    EXPECT_FALSE(result.ok());
}

TEST_F(DatasetLoaderTest, LoadFromBytes_MissingOrNonArrayData_Malformed) {
    for (const char* bytes : {R"({"items": []})", R"({"data": {"id": 1}})", R"([{"id": 1}])", R"("data")"}) {
        const LoadResult result = DatasetLoader::loadFromBytes(bytes);
        EXPECT_TRUE(result.records->empty()) << bytes;
        ASSERT_TRUE(result.diagnostic.has_value()) << bytes;
        EXPECT_EQ(result.diagnostic->kind, LoadDiagnostic::Kind::MALFORMED_SOURCE) << bytes;
        EXPECT_FALSE(result.diagnostic->offset.has_value()) << bytes;
    }
}

TEST_F(DatasetLoaderTest, LoadFromBytes_EmptyDataArray_IsValid) {
    const LoadResult result = DatasetLoader::loadFromBytes(R"({"data": []})");
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.records->empty());
    EXPECT_EQ(result.droppedCount, 0u);
}

TEST_F(DatasetLoaderTest, LoadFromFile_MissingFile_SourceUnavailable) {
    const std::string path = (dir / "does_not_exist.json").string();
    const LoadResult result = DatasetLoader::loadFromFile(path);

    EXPECT_TRUE(result.records->empty());
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_EQ(result.diagnostic->kind, LoadDiagnostic::Kind::SOURCE_UNAVAILABLE);
    EXPECT_EQ(result.diagnostic->source, path);
}

TEST_F(DatasetLoaderTest, LoadFromFile_ValidFile_LoadsRecords) {
    const std::string path = writeFile("net.json", R"({"data": [{"id": 1, "asn": 13335}, {"id": 2, "asn": 15169}]})");
    const LoadResult result = DatasetLoader::loadFromFile(path);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.records->size(), 2u);
}

TEST_F(DatasetLoaderTest, LoadFromFile_MalformedFile_ReportsPath) {
    const std::string path = writeFile("bad.json", "{\"data\": [");
    const LoadResult result = DatasetLoader::loadFromFile(path);

    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_EQ(result.diagnostic->kind, LoadDiagnostic::Kind::MALFORMED_SOURCE);
    EXPECT_EQ(result.diagnostic->source, path);
}
