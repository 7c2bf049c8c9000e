/**
 * @file test_graph_exporter.cpp
 * @brief JSON graph layout and CSV table output
 */

#include <gtest/gtest.h>
#include <export/graph_exporter.hpp>
#include <export/table_writer.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace Broadsheet;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

GraphStore sample_store() {
    GraphStore store;

    GlobalEntity person;
    person.id = "aaaaaaaaaaaa";
    person.type = EntityType::Person;
    person.text = "Bonaparte, Napoleon";
    person.normalized = "Napoleon";
    person.confidence = 0.9;
    person.sources = {"doc1", "doc2"};
    store.add_entity(person);

    GlobalEntity place;
    place.id = "bbbbbbbbbbbb";
    place.type = EntityType::Location;
    place.text = "Wien";
    place.confidence = 0.8;
    place.sources = {"doc1"};
    place.location.latitude = 48.208174;
    place.location.longitude = 16.373819;
    place.location.display_name = "Wien, \"Kaiserstadt\"";
    place.location.osm_id = "109166";
    store.add_entity(place);

    GlobalEntity time;
    time.id = "cccccccccccc";
    time.type = EntityType::Time;
    time.text = "13 November 1805";
    time.confidence = 0.7;
    time.sources = {"doc2"};
    time.time.precision = TimePrecision::Day;
    time.time.kind = TimeKind::Point;
    time.time.start_date = "1805-11-13";
    store.add_entity(time);

    GlobalRelation rel;
    rel.id = "R0123456789a";
    rel.subject = person.id;
    rel.predicate = "entered";
    rel.object = place.id;
    rel.confidence = 0.75;
    rel.context_time = time.id;
    rel.sources = {"doc1", "doc2"};
    store.add_relation("sig", rel);
    return store;
}

class GraphExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("broadsheet_export_" + std::to_string(stamp));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

} // namespace

TEST_F(GraphExporterTest, JsonLayout) {
    GraphStore store = sample_store();
    auto j = GraphExporter::to_json(store);

    ASSERT_EQ(j["entities"].size(), 3u);
    ASSERT_EQ(j["relations"].size(), 1u);

    const auto& person = j["entities"][0];
    EXPECT_EQ(person["id"], "aaaaaaaaaaaa");
    EXPECT_EQ(person["type"], "PERSON");
    EXPECT_EQ(person["normalized"], "Napoleon");
    EXPECT_EQ(person["sources"], GraphExporter::Json::array({"doc1", "doc2"}));
    EXPECT_FALSE(person.contains("attributes"));

    const auto& place = j["entities"][1];
    EXPECT_FALSE(place.contains("normalized"));
    EXPECT_EQ(place["attributes"]["latitude"], 48.208174);
    EXPECT_EQ(place["attributes"]["osm_id"], "109166");
    EXPECT_FALSE(place["attributes"].contains("importance"));

    const auto& time = j["entities"][2];
    EXPECT_EQ(time["attributes"]["precision"], "DAY");
    EXPECT_EQ(time["attributes"]["type"], "POINT");

    const auto& rel = j["relations"][0];
    EXPECT_EQ(rel["context_time"], "cccccccccccc");
    EXPECT_FALSE(rel.contains("context_location"));
}

TEST_F(GraphExporterTest, UnlistedTypeNameIsExported) {
    GraphStore store;
    GlobalEntity date;
    date.id = "dddddddddddd";
    date.type = EntityType::Other;
    date.other_type = "DATE";
    date.text = "4 April";
    date.confidence = 0.8;
    date.sources = {"doc1"};
    store.add_entity(date);

    auto j = GraphExporter::to_json(store);
    EXPECT_EQ(j["entities"][0]["type"], "DATE");

    GraphExporter::write_tables(store, dir_);
    auto lines = read_lines(dir_ / "entities.csv");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "dddddddddddd,DATE,4 April,,0.8,doc1");
}

TEST_F(GraphExporterTest, WriteJsonCreatesParents) {
    GraphStore store = sample_store();
    fs::path out = dir_ / "integrated_results" / "graph.json";
    GraphExporter::write_json(store, out);

    std::ifstream in(out);
    auto j = GraphExporter::Json::parse(in);
    EXPECT_EQ(j, GraphExporter::to_json(store));
}

TEST_F(GraphExporterTest, WritesFourTables) {
    GraphStore store = sample_store();
    TableCounts counts = GraphExporter::write_tables(store, dir_);

    EXPECT_EQ(counts.entities, 3u);
    EXPECT_EQ(counts.locations, 1u);
    EXPECT_EQ(counts.timeperiods, 1u);
    EXPECT_EQ(counts.relations, 1u);

    auto entities = read_lines(dir_ / "entities.csv");
    ASSERT_EQ(entities.size(), 4u);
    EXPECT_EQ(entities[0], "entity_id,type,text,normalized,confidence,sources");
    EXPECT_EQ(entities[1], "aaaaaaaaaaaa,PERSON,\"Bonaparte, Napoleon\",Napoleon,0.9,doc1|doc2");
    EXPECT_EQ(entities[2], "bbbbbbbbbbbb,LOCATION,Wien,,0.8,doc1");

    auto locations = read_lines(dir_ / "locations.csv");
    ASSERT_EQ(locations.size(), 2u);
    EXPECT_EQ(locations[0], "entity_id,latitude,longitude,display_name,location_type,importance,"
                            "bbox_south,bbox_north,bbox_west,bbox_east");
    EXPECT_EQ(locations[1], "bbbbbbbbbbbb,48.208174,16.373819,\"Wien, \"\"Kaiserstadt\"\"\",,,,,,");

    auto times = read_lines(dir_ / "timeperiods.csv");
    ASSERT_EQ(times.size(), 2u);
    EXPECT_EQ(times[0], "entity_id,precision,type,start_date,end_date,date_reliability");
    EXPECT_EQ(times[1], "cccccccccccc,DAY,POINT,1805-11-13,,");

    auto relations = read_lines(dir_ / "relations.csv");
    ASSERT_EQ(relations.size(), 2u);
    EXPECT_EQ(relations[0], "relation_id,subject_id,predicate,object_id,confidence,"
                            "context_time_id,context_location_id,sources");
    EXPECT_EQ(relations[1], "R0123456789a,aaaaaaaaaaaa,entered,bbbbbbbbbbbb,0.75,cccccccccccc,,doc1|doc2");
}

TEST_F(GraphExporterTest, EmptyStoreWritesHeadersOnly) {
    GraphStore store;
    GraphExporter::write_tables(store, dir_);
    for (const char* name : {"entities.csv", "locations.csv", "timeperiods.csv", "relations.csv"}) {
        EXPECT_EQ(read_lines(dir_ / name).size(), 1u) << name;
    }
    EXPECT_EQ(GraphExporter::to_json(store).dump(), R"({"entities":[],"relations":[]})");
}

TEST_F(GraphExporterTest, TableWriterPadsAndQuotes) {
    {
        TableWriter writer(dir_);
        writer.begin_table("t", {"a", "b", "c"});
        writer.add_row({"x"});
        writer.add_row({"multi\nline", "", "q\"uote"});
        EXPECT_EQ(writer.count(), 2u);
        EXPECT_THROW(writer.add_row({"1", "2", "3", "4"}), std::invalid_argument);
        // destructor flushes
    }

    std::ifstream in(dir_ / "t.csv", std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "a,b,c\nx,,\n\"multi\nline\",,\"q\"\"uote\"\n");
}

TEST_F(GraphExporterTest, TableWriterRequiresTable) {
    TableWriter writer(dir_);
    EXPECT_THROW(writer.add_row({"x"}), std::runtime_error);
}
