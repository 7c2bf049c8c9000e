/**
 * @file test_document_loader.cpp
 * @brief Extraction file parsing, layout detection and parallel loading
 */

#include <gtest/gtest.h>
#include <ingestion/document_loader.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Broadsheet;
namespace fs = std::filesystem;
using Json = DocumentLoader::Json;

namespace {

class DocumentLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("broadsheet_loader_" + std::to_string(stamp));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    fs::path dir_;
};

const char* k_single = R"({
  "entities": [
    {"id": "e1", "type": "PERSON", "text": "Napoleon", "normalized": "Napoleon Bonaparte", "confidence": 0.9},
    {"id": "e2", "type": "LOCATION", "text": "Wien", "confidence": 0.8},
    {"id": "e3", "type": "TIME", "text": "13 November 1805"}
  ],
  "relations": [
    {"subject": "e1", "predicate": "entered", "object": "e2", "confidence": 0.7, "context_time": "e3"}
  ],
  "locations": [
    {"entity_id": "e2", "latitude": 48.2082, "longitude": "16.3738", "display_name": "Wien", "osm_id": 109166}
  ],
  "timeperiods": [
    {"entity_id": "e3", "precision": "DAY", "type": "POINT", "start_date": "1805-11-13"}
  ]
})";

} // namespace

TEST_F(DocumentLoaderTest, ParsesSingleDocumentFile) {
    auto result = DocumentLoader::load_file(write("wiener_zeitung_1805.json", k_single));
    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(result.documents.size(), 1u);

    const auto& doc = result.documents[0];
    EXPECT_EQ(doc.id, "wiener_zeitung_1805");
    ASSERT_EQ(doc.entities.size(), 3u);
    EXPECT_EQ(doc.entities[0].type, EntityType::Person);
    EXPECT_EQ(doc.entities[0].normalized, "Napoleon Bonaparte");
    EXPECT_DOUBLE_EQ(doc.entities[0].confidence, 0.9);
    EXPECT_DOUBLE_EQ(doc.entities[2].confidence, 0.0);

    ASSERT_EQ(doc.relations.size(), 1u);
    EXPECT_EQ(doc.relations[0].context_time, "e3");
    EXPECT_FALSE(doc.relations[0].context_location.has_value());

    ASSERT_EQ(doc.locations.size(), 1u);
    const auto& loc = doc.locations[0].attributes;
    EXPECT_EQ(doc.locations[0].entity_id, "e2");
    EXPECT_EQ(loc.latitude, 48.2082);
    EXPECT_EQ(loc.longitude, 16.3738);
    EXPECT_EQ(loc.osm_id, "109166");
    EXPECT_FALSE(loc.importance.has_value());

    ASSERT_EQ(doc.timeperiods.size(), 1u);
    const auto& t = doc.timeperiods[0].attributes;
    EXPECT_EQ(t.precision, TimePrecision::Day);
    EXPECT_EQ(t.kind, TimeKind::Point);
    EXPECT_EQ(t.start_date, "1805-11-13");
    EXPECT_FALSE(t.end_date.has_value());
    EXPECT_EQ(result.stats.total(), 0u);
}

TEST_F(DocumentLoaderTest, SplitsMultiDocumentFile) {
    Json root;
    root["p1"] = Json::parse(k_single);
    root["p2"] = Json{{"entities", Json::array()}, {"relations", Json::array()}};
    auto result = DocumentLoader::load_file(write("issue_12.json", root.dump()));

    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(result.documents.size(), 2u);
    EXPECT_EQ(result.documents[0].id, "issue_12_p1");
    EXPECT_EQ(result.documents[1].id, "issue_12_p2");
    EXPECT_EQ(result.documents[0].entities.size(), 3u);
    EXPECT_TRUE(result.documents[1].entities.empty());
}

TEST_F(DocumentLoaderTest, LayoutDetection) {
    EXPECT_TRUE(DocumentLoader::is_multi_document(Json::parse(R"({"a": {}, "b": {"entities": []}})")));
    EXPECT_FALSE(DocumentLoader::is_multi_document(Json::parse(R"({"entities": {}})")));
    EXPECT_FALSE(DocumentLoader::is_multi_document(Json::parse(R"({"a": {}, "b": []})")));
    EXPECT_FALSE(DocumentLoader::is_multi_document(Json::parse(R"([{}])")));
}

TEST_F(DocumentLoaderTest, SkipsMalformedRecords) {
    const char* text = R"({
      "entities": [
        {"id": "e1", "type": "PERSON", "text": "Murat"},
        {"id": "e2", "type": "", "text": "Franz"},
        {"type": "PERSON", "text": "no id"},
        {"id": 7, "type": "EVENT", "text": "Capitulation", "confidence": "0.4"},
        "not an object"
      ],
      "relations": [
        {"subject": "e1", "object": "e7"},
        {"subject": "e1", "predicate": "led", "object": "7"}
      ],
      "locations": [{"latitude": 1.0}],
      "timeperiods": "oops"
    })";
    DocumentLoadStats stats;
    auto doc = DocumentLoader::parse_document("d", Json::parse(text), stats);

    ASSERT_EQ(doc.entities.size(), 2u);
    EXPECT_EQ(doc.entities[1].id, "7");
    EXPECT_DOUBLE_EQ(doc.entities[1].confidence, 0.4);
    EXPECT_EQ(doc.relations.size(), 1u);
    EXPECT_TRUE(doc.locations.empty());
    EXPECT_TRUE(doc.timeperiods.empty());

    EXPECT_EQ(stats.entities_skipped, 3u);
    EXPECT_EQ(stats.relations_skipped, 1u);
    EXPECT_EQ(stats.attribute_rows_skipped, 1u);
}

TEST_F(DocumentLoaderTest, KeepsUnlistedEntityTypes) {
    const char* text = R"({
      "entities": [
        {"id": "E1", "type": "PERSON", "text": "French troops", "confidence": 0.9},
        {"id": "E2", "type": "DATE", "text": "4 April", "confidence": 0.8}
      ],
      "relations": [{"subject": "E1", "predicate": "entered", "object": "E2", "confidence": 0.9}]
    })";
    DocumentLoadStats stats;
    auto doc = DocumentLoader::parse_document("d", Json::parse(text), stats);

    ASSERT_EQ(doc.entities.size(), 2u);
    EXPECT_EQ(doc.entities[0].type, EntityType::Person);
    EXPECT_TRUE(doc.entities[0].other_type.empty());
    EXPECT_EQ(doc.entities[1].type, EntityType::Other);
    EXPECT_EQ(doc.entities[1].other_type, "DATE");
    EXPECT_EQ(doc.entities[1].type_name(), "DATE");
    EXPECT_EQ(doc.relations.size(), 1u);
    EXPECT_EQ(stats.entities_skipped, 0u);
}

TEST_F(DocumentLoaderTest, UnparsableFileIsReportedNotThrown) {
    auto broken = DocumentLoader::load_file(write("broken.json", "{\"entities\": ["));
    EXPECT_FALSE(broken.ok);
    EXPECT_FALSE(broken.error.empty());

    auto array = DocumentLoader::load_file(write("array.json", "[1, 2]"));
    EXPECT_FALSE(array.ok);

    auto missing = DocumentLoader::load_file(dir_ / "missing.json");
    EXPECT_FALSE(missing.ok);
}

TEST_F(DocumentLoaderTest, ListInputsSortedJsonOnly) {
    write("b.json", "{}");
    write("a.json", "{}");
    write("notes.txt", "");
    fs::create_directories(dir_ / "sub.json");

    auto files = DocumentLoader::list_inputs(dir_);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), "a.json");
    EXPECT_EQ(files[1].filename(), "b.json");

    EXPECT_THROW(DocumentLoader::list_inputs(dir_ / "nowhere"), std::runtime_error);
}

TEST_F(DocumentLoaderTest, LoadBatchKeepsInputOrder) {
    std::vector<fs::path> paths;
    for (int i = 0; i < 9; ++i) {
        paths.push_back(write("doc" + std::to_string(i) + ".json", i == 4 ? "not json" : k_single));
    }

    auto results = DocumentLoader::load_batch(paths, 4);
    ASSERT_EQ(results.size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(results[i].path, paths[i]);
        EXPECT_EQ(results[i].ok, i != 4);
        if (results[i].ok) {
            EXPECT_EQ(results[i].documents[0].id, "doc" + std::to_string(i));
        }
    }

    EXPECT_TRUE(DocumentLoader::load_batch({}, 4).empty());
}
